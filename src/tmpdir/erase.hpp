#pragma once

#include <tmpdir/error/result_fwd.hpp>
#include <tmpdir/util/fs/path.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tmpdir {

/**
 * @brief How thoroughly the contents of a directory are destroyed.
 */
enum class deletion_policy {
    /// Ordinary recursive removal
    pass_through,
    /// In-process overwrite, rename, and remove. Needs no external tools.
    pseudo_secure,
    /// Hand the directory to the external wipe program. Fails if the program is unavailable.
    secure,
    /// `secure` if the external wipe program is available, otherwise `pseudo_secure`
    attempt_secure,
};

/**
 * @brief Parse a user-facing policy name: "secure", "attempt-secure", "pseudo-secure", or
 * "not-secure". Unknown names fail with e_invalid_deletion_policy.
 */
[[nodiscard]] result<deletion_policy> parse_deletion_policy(std::string_view name) noexcept;

/// The user-facing name of a policy, the inverse of parse_deletion_policy
std::string_view user_facing_name(deletion_policy) noexcept;

/// Files are overwritten in chunks of this many bytes, each synced to storage before the next
inline constexpr std::size_t overwrite_chunk_size = 1024;

/**
 * @brief Overwrite every byte of a regular file with zeros, syncing after each chunk.
 *
 * Symlinks are not followed. The file's size is unchanged.
 */
[[nodiscard]] result<void> overwrite_with_zeros(path_ref file) noexcept;

/**
 * @brief Destroys directory trees according to a fixed deletion policy.
 *
 * The availability of the external wipe program is checked once, when the eraser is created.
 */
class secure_eraser {
    deletion_policy         _policy;
    std::optional<fs::path> _wipe_program;

    secure_eraser(deletion_policy p, std::optional<fs::path> prog) noexcept
        : _policy(p)
        , _wipe_program(std::move(prog)) {}

public:
    /**
     * @brief Create an eraser for the requested policy.
     *
     * `attempt_secure` resolves to `secure` or `pseudo_secure` depending on whether the wipe
     * program can be found. Requesting `secure` when it cannot be found fails with
     * e_capability_unavailable.
     *
     * @param requested The requested policy
     * @param wipe_program The name or path of the external wipe program
     */
    [[nodiscard]] static result<secure_eraser> for_policy(deletion_policy  requested,
                                                          std::string_view wipe_program) noexcept;
    /// Create an eraser using the wipe program named by the configuration
    [[nodiscard]] static result<secure_eraser> for_policy(deletion_policy requested);

    /// The effective policy. Never `attempt_secure`.
    deletion_policy policy() const noexcept { return _policy; }

    /// The resolved path to the external wipe program, if the policy uses one
    const std::optional<fs::path>& wipe_program() const noexcept { return _wipe_program; }

    /**
     * @brief Destroy the given file or directory tree.
     *
     * On failure the error carries e_deletion_failed with the path.
     */
    [[nodiscard]] result<void> erase(path_ref path) const noexcept;
};

}  // namespace tmpdir
