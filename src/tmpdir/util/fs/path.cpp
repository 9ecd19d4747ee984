#include "./path.hpp"

#include <tmpdir/error/result.hpp>

#include <algorithm>

using namespace tmpdir;

fs::path tmpdir::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (!p.empty() && p.filename().empty() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

fs::path tmpdir::resolve_path_weak(path_ref p) noexcept {
    std::error_code ec;
    auto            canon = fs::weakly_canonical(p, ec);
    if (ec) {
        return normalize_path(fs::absolute(p, ec));
    }
    return normalize_path(canon);
}

result<fs::path> tmpdir::resolve_path_strong(path_ref p_) noexcept {
    std::error_code ec;
    auto            p = fs::canonical(p_, ec);
    if (ec) {
        return new_error(ec, e_resolve_path{p_});
    }
    return normalize_path(p);
}

bool tmpdir::path_is_within(path_ref parent_, path_ref child_) noexcept {
    const auto parent = normalize_path(parent_);
    const auto child  = normalize_path(child_);
    auto       p_it   = parent.begin();
    auto       p_end  = parent.end();
    auto       c_it   = child.begin();
    auto       c_end  = child.end();
    for (; p_it != p_end; ++p_it, ++c_it) {
        if (c_it == c_end || *c_it != *p_it) {
            return false;
        }
    }
    // Any remaining elements of the child must not climb back out of the parent
    return std::none_of(c_it, c_end, [](path_ref elem) { return elem == ".."; });
}
