#pragma once

#include <tmpdir/error/result_fwd.hpp>

#include <filesystem>

namespace tmpdir {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

/**
 * @brief An error occurring when resolving a filepath
 */
struct e_resolve_path {
    fs::path value;
};

/**
 * @brief Convert a path to its most-normal form.
 *
 * This removes redundant path elements (dots and dot-dots) and trailing directory separators.
 * Leading dot-dots of a relative path are kept.
 */
[[nodiscard]] fs::path normalize_path(path_ref p) noexcept;

/**
 * @brief Obtain the normalized absolute path to a possibly-existing file or directory.
 *
 * Symlinks in the portion of the path that exists are resolved.
 */
[[nodiscard]] fs::path resolve_path_weak(path_ref p) noexcept;

/**
 * @brief Obtain the normalized path to an existing file or directory.
 */
[[nodiscard]] result<fs::path> resolve_path_strong(path_ref p) noexcept;

/**
 * @brief Determine whether `child` is `parent` or one of its descendants.
 *
 * Both paths are normalized lexically, then compared element-by-element, so "/safe-evil" is not
 * within "/safe". Symlinks are not resolved.
 */
[[nodiscard]] bool path_is_within(path_ref parent, path_ref child) noexcept;

}  // namespace tmpdir
