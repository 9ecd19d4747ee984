#pragma once

#include <tmpdir/error/result_fwd.hpp>
#include <tmpdir/util/fs/path.hpp>

#include <string_view>

namespace tmpdir {

/**
 * @brief How an absolute path recorded in an untrusted archive is treated
 */
enum class absolute_member_policy {
    /// Fail with e_path_traversal
    reject,
    /// Strip the root and resolve the remainder against the sandbox root
    reroot,
};

/**
 * @brief Resolve an untrusted relative path against `base`, failing if it escapes.
 *
 * The candidate is lexically normalized before joining. Any ".." that would climb above `base`
 * fails, as does an absolute candidate when the policy is `reject`. The joined path is then resolved
 * through any existing symlinks, and must still lie within the resolved `base`.
 *
 * On failure, the error carries e_path_traversal (the candidate as given) and e_sandbox_root.
 *
 * @param base The absolute directory that must contain the result
 * @param candidate The untrusted path, as recorded in an archive
 * @param abs_policy Whether absolute candidates are rejected or re-rooted
 * @return The absolute path within `base`. May be equal to `base` itself (e.g. for "./")
 */
[[nodiscard]] result<fs::path>
validate_member_path(path_ref               base,
                     std::string_view       candidate,
                     absolute_member_policy abs_policy = absolute_member_policy::reject) noexcept;

}  // namespace tmpdir
