#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace tmpdir {

struct e_open_file_path {
    std::filesystem::path value;
};

struct e_write_file_path {
    std::filesystem::path value;
};

struct e_read_file_path {
    std::filesystem::path value;
};

/**
 * @brief Open a file stream, throwing an exception with the errno and path attached on failure
 */
[[nodiscard]] std::fstream open_file(std::filesystem::path const& filepath, std::ios::openmode);

/**
 * @brief Flush and close a stream that was written to, throwing if any write failed along the way.
 *
 * `filepath` is only used for diagnostics.
 */
void finish_file(std::fstream& strm, std::filesystem::path const& filepath);

/// Replace the content of the given file
void                      write_file(std::filesystem::path const& path, std::string_view);
[[nodiscard]] std::string read_file(std::filesystem::path const& path);

}  // namespace tmpdir
