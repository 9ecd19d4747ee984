#include "./erase.hpp"

#include <tmpdir/config.hpp>
#include <tmpdir/error/errors.hpp>
#include <tmpdir/error/on_error.hpp>
#include <tmpdir/error/result.hpp>
#include <tmpdir/random_name.hpp>
#include <tmpdir/util/fs/shutil.hpp>
#include <tmpdir/util/log.hpp>
#include <tmpdir/util/proc.hpp>

#include <boost/leaf/result.hpp>
#include <magic_enum.hpp>
#include <neo/assert.hpp>

#include <vector>

using namespace tmpdir;

namespace {

/// List the immediate children of a directory. Symlinks are listed, not followed.
result<std::vector<fs::directory_entry>> list_children(path_ref dir) noexcept {
    std::error_code                  ec;
    std::vector<fs::directory_entry> ret;
    fs::directory_iterator           iter{dir, ec};
    for (; !ec && iter != fs::directory_iterator{}; iter.increment(ec)) {
        ret.push_back(*iter);
    }
    if (ec) {
        return new_error(ec, e_resolve_path{dir});
    }
    return ret;
}

bool is_real_directory(const fs::directory_entry& entry) noexcept {
    std::error_code ec;
    return entry.is_directory(ec) && !entry.is_symlink(ec);
}

/// Phase one: zero the content of every regular file
result<void> zero_all_files(path_ref dir) noexcept {
    BOOST_LEAF_AUTO(children, list_children(dir));
    for (auto& child : children) {
        std::error_code ec;
        if (is_real_directory(child)) {
            BOOST_LEAF_CHECK(zero_all_files(child.path()));
        } else if (child.is_regular_file(ec) && !child.is_symlink(ec)) {
            tmpdir_log(trace, "Overwriting [{}]", child.path().string());
            BOOST_LEAF_CHECK(overwrite_with_zeros(child.path()));
        }
    }
    return {};
}

/// Phase two: give every file and directory a random name, deepest first
result<void> anonymize_names(path_ref dir, name_generator& names) noexcept {
    BOOST_LEAF_AUTO(children, list_children(dir));
    for (auto& child : children) {
        const bool is_dir = is_real_directory(child);
        if (is_dir) {
            BOOST_LEAF_CHECK(anonymize_names(child.path(), names));
        }
        BOOST_LEAF_AUTO(new_path, unused_sibling_name(names, dir, is_dir ? "" : ".tmp"));
        BOOST_LEAF_CHECK(rename_file(child.path(), new_path));
    }
    return {};
}

/// Phase three: remove every file, then each directory once it is empty
result<void> remove_bottom_up(path_ref dir) noexcept {
    BOOST_LEAF_AUTO(children, list_children(dir));
    for (auto& child : children) {
        if (is_real_directory(child)) {
            BOOST_LEAF_CHECK(remove_bottom_up(child.path()));
        }
        BOOST_LEAF_CHECK(remove_file(child.path()));
    }
    return {};
}

result<void> pseudo_secure_erase(path_ref path) noexcept {
    std::error_code ec;
    auto            st = fs::symlink_status(path, ec);
    if (!fs::is_directory(st)) {
        if (fs::is_regular_file(st)) {
            BOOST_LEAF_CHECK(overwrite_with_zeros(path));
        }
        return ensure_absent(path);
    }

    name_generator names;
    tmpdir_log(trace, "Pseudo-secure erase [{}]: overwriting file contents", path.string());
    BOOST_LEAF_CHECK(zero_all_files(path));
    tmpdir_log(trace, "Pseudo-secure erase [{}]: renaming entries", path.string());
    BOOST_LEAF_CHECK(anonymize_names(path, names));
    tmpdir_log(trace, "Pseudo-secure erase [{}]: removing entries", path.string());
    BOOST_LEAF_CHECK(remove_bottom_up(path));
    return remove_file(path);
}

result<void> external_wipe(path_ref path, path_ref program) noexcept {
    proc_result res;
    try {
        res = run_proc(proc_options{.command = {program.string(), "-rfs", "--", path.string()}});
    } catch (const std::system_error& e) {
        return new_error(e.code());
    }
    if (!res.output.empty()) {
        tmpdir_log(debug, "Output from [{}]:\n{}", program.string(), res.output);
    }
    if (!res.okay()) {
        tmpdir_log(error,
                   "Secure wipe program [{}] failed on [{}] (exit {}, signal {})",
                   program.string(),
                   path.string(),
                   res.retc,
                   res.signal);
        return new_error(e_wipe_exit_status{res.signal ? 128 + res.signal : res.retc});
    }
    return {};
}

}  // namespace

result<deletion_policy> tmpdir::parse_deletion_policy(std::string_view name) noexcept {
    if (name == "secure") {
        return deletion_policy::secure;
    } else if (name == "attempt-secure") {
        return deletion_policy::attempt_secure;
    } else if (name == "pseudo-secure") {
        return deletion_policy::pseudo_secure;
    } else if (name == "not-secure") {
        return deletion_policy::pass_through;
    }
    return new_error(e_invalid_deletion_policy{std::string(name)});
}

std::string_view tmpdir::user_facing_name(deletion_policy p) noexcept {
    switch (p) {
    case deletion_policy::secure:
        return "secure";
    case deletion_policy::attempt_secure:
        return "attempt-secure";
    case deletion_policy::pseudo_secure:
        return "pseudo-secure";
    case deletion_policy::pass_through:
        return "not-secure";
    }
    return "unknown";
}

result<secure_eraser> secure_eraser::for_policy(deletion_policy  requested,
                                                std::string_view wipe_program) noexcept {
    if (requested != deletion_policy::secure && requested != deletion_policy::attempt_secure) {
        return secure_eraser{requested, std::nullopt};
    }

    auto found = find_program(wipe_program);
    if (found) {
        tmpdir_log(debug, "Secure deletion will use [{}]", found->string());
        return secure_eraser{deletion_policy::secure, std::move(found)};
    }
    if (requested == deletion_policy::attempt_secure) {
        tmpdir_log(warn,
                   "Secure wipe program [{}] is not available. Falling back to pseudo-secure "
                   "deletion.",
                   wipe_program);
        return secure_eraser{deletion_policy::pseudo_secure, std::nullopt};
    }
    return new_error(e_capability_unavailable{std::string(wipe_program)});
}

result<secure_eraser> secure_eraser::for_policy(deletion_policy requested) {
    return for_policy(requested, config::wipe_program());
}

result<void> secure_eraser::erase(path_ref path) const noexcept {
    TMPDIR_E_SCOPE(e_deletion_failed{path});
    tmpdir_log(debug, "Erasing [{}] ({})", path.string(), magic_enum::enum_name(_policy));
    switch (_policy) {
    case deletion_policy::pass_through:
        return ensure_absent(path);
    case deletion_policy::pseudo_secure:
        return pseudo_secure_erase(path);
    case deletion_policy::secure:
    case deletion_policy::attempt_secure:
        neo_assert(invariant,
                   _wipe_program.has_value(),
                   "A secure eraser was created without a wipe program",
                   path.string());
        return external_wipe(path, *_wipe_program);
    }
    return new_error(std::make_error_code(std::errc::invalid_argument));
}
