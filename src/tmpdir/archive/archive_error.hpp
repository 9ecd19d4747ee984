#pragma once

#include <string_view>

struct archive;

namespace tmpdir::detail {

struct archive_read_deleter {
    void operator()(struct archive* a) const noexcept;
};

struct archive_write_deleter {
    void operator()(struct archive* a) const noexcept;
};

/**
 * @brief Throw an exception describing the most recent failure recorded on the given archive handle
 */
[[noreturn]] void throw_archive_error(struct archive* a, std::string_view what);

/// Throw if `rc` is a libarchive failure code. Warnings are logged and tolerated.
void check_archive_rc(struct archive* a, int rc, std::string_view what);

}  // namespace tmpdir::detail
