#pragma once

#include "./format.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string_view>

namespace tmpdir {

/**
 * @brief Writes members into a new archive stream.
 *
 * Members may be added in any order. Member paths are written as given, without validation.
 * `finish()` must be called to write the archive trailer; an archive destroyed
 * without finishing is incomplete. Errors are thrown with an e_archive_error attached.
 */
class archive_writer {
    struct state;
    std::unique_ptr<state> _state;

    explicit archive_writer(std::unique_ptr<state>) noexcept;

public:
    archive_writer(archive_writer&&) noexcept;
    archive_writer& operator=(archive_writer&&) noexcept;
    ~archive_writer();

    /// Begin writing an archive of the given kind. The stream must outlive the writer.
    [[nodiscard]] static archive_writer open(std::ostream& strm, compression_kind kind);

    void add_directory(std::string_view relpath);

    /**
     * @brief Add a regular file with the given content
     *
     * @param relpath The path of the member within the archive
     * @param content A stream that will provide exactly `size` bytes
     * @param size The number of bytes in the file
     */
    void add_file(std::string_view relpath, std::istream& content, std::int64_t size);

    /// Flush all pending data and write the end of the archive
    void finish();
};

}  // namespace tmpdir
