#include "./path_guard.hpp"

#include <tmpdir/error/errors.hpp>
#include <tmpdir/error/on_error.hpp>
#include <tmpdir/error/result.hpp>
#include <tmpdir/util/log.hpp>

using namespace tmpdir;

namespace {

auto traversal_error(std::string_view candidate) {
    return new_error(e_path_traversal{std::string(candidate)});
}

}  // namespace

result<fs::path> tmpdir::validate_member_path(path_ref               base_,
                                              std::string_view       candidate,
                                              absolute_member_policy abs_policy) noexcept {
    TMPDIR_E_SCOPE(e_sandbox_root{base_});
    if (candidate.empty() || candidate.find('\0') != candidate.npos) {
        return traversal_error(candidate);
    }

    fs::path rel{candidate};
    if (rel.has_root_path()) {
        if (abs_policy == absolute_member_policy::reject) {
            tmpdir_log(debug, "Rejecting absolute member path [{}]", candidate);
            return traversal_error(candidate);
        }
        rel = rel.relative_path();
    }

    const auto norm_rel = rel.lexically_normal();
    if (!norm_rel.empty() && *norm_rel.begin() == "..") {
        tmpdir_log(debug, "Member path [{}] climbs above its root", candidate);
        return traversal_error(candidate);
    }

    const auto base   = normalize_path(base_);
    const auto joined = normalize_path(base / rel);
    if (!path_is_within(base, joined)) {
        tmpdir_log(debug, "Member path [{}] resolves outside of [{}]", candidate, base.string());
        return traversal_error(candidate);
    }

    // The lexical check cannot see symlinks that already exist on disk beneath the base
    const auto real_base   = resolve_path_weak(base);
    const auto real_joined = resolve_path_weak(joined);
    if (!path_is_within(real_base, real_joined)) {
        tmpdir_log(debug,
                   "Member path [{}] reaches outside of [{}] through a symlink (resolved to [{}])",
                   candidate,
                   base.string(),
                   real_joined.string());
        return traversal_error(candidate);
    }
    return joined;
}
