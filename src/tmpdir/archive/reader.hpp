#pragma once

#include "./format.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace tmpdir {

enum class member_kind {
    file,
    directory,
    /// Symlinks, hard links, devices, FIFOs. These are never materialized.
    other,
};

/**
 * @brief The header of one archive member. The path is untrusted.
 */
struct archive_member {
    std::string  path;
    member_kind  kind = member_kind::other;
    std::int64_t size = 0;
};

/**
 * @brief A forward-only, single-pass reader of the members of an archive stream.
 *
 * Members are produced in archive order by `next()`. The payload of the most recent member may be
 * read with `copy_data_to()` before advancing; unread payload is skipped. Errors are thrown with an
 * e_archive_error attached.
 */
class archive_reader {
    struct state;
    std::unique_ptr<state> _state;

    explicit archive_reader(std::unique_ptr<state>) noexcept;

public:
    archive_reader(archive_reader&&) noexcept;
    archive_reader& operator=(archive_reader&&) noexcept;
    ~archive_reader();

    /**
     * @brief Begin reading an archive of the given kind from a stream.
     *
     * The stream must outlive the reader. If the stream can report and restore its position, it
     * will be used for random access where the container benefits from it (zip).
     */
    [[nodiscard]] static archive_reader open(std::istream& strm, compression_kind kind);

    /// Advance to the next member, or return nullopt at the end of the archive
    [[nodiscard]] std::optional<archive_member> next();

    /// Write the payload of the current member to the given output
    void copy_data_to(std::ostream& out);
};

}  // namespace tmpdir
