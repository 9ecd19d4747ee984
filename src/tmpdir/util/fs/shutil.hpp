#pragma once

#include "./path.hpp"

#include <tmpdir/error/result_fwd.hpp>

#include <ostream>

namespace tmpdir::inline file_utils {

struct e_remove_file {
    fs::path value;
};

struct e_create_directory {
    fs::path value;
};

/**
 * @brief Ensure that the named file/directory does not exist.
 *
 * If the file does not exist, no error occurs.
 */
[[nodiscard]] result<void> ensure_absent(path_ref path) noexcept;

/**
 * @brief Delete the named file or empty directory.
 *
 * If the file does not exist, results in an error.
 */
[[nodiscard]] result<void> remove_file(path_ref file) noexcept;

/**
 * @brief Create the given directory and all missing parents.
 */
[[nodiscard]] result<void> create_directories(path_ref dirpath) noexcept;

struct e_move_file {
    fs::path source;
    fs::path dest;

    friend std::ostream& operator<<(std::ostream& out, const e_move_file& self) noexcept {
        out << "e_move_file: From [" << self.source.string() << "] to [" << self.dest.string()
            << "]";
        return out;
    }
};

/**
 * @brief Atomically rename the file or directory 'source' to 'dest'
 *
 * Unlike a general move, this never falls back to copying: if the rename cannot be done in a
 * single step (e.g. across filesystems), an error is returned and 'source' is untouched.
 *
 * @param source The file or directory to rename
 * @param dest The destination path (not parent directory!) of the file/directory
 */
[[nodiscard]] result<void> rename_file(path_ref source, path_ref dest) noexcept;

}  // namespace tmpdir::inline file_utils
