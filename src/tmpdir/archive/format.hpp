#pragma once

#include <tmpdir/error/result_fwd.hpp>

#include <iosfwd>
#include <optional>
#include <string_view>

namespace tmpdir {

/**
 * @brief The byte-level compression of an archive stream.
 *
 * `none`, `gzip`, and `bzip2` all wrap a tar container. `zip` is its own container and carries its
 * own per-member compression.
 */
enum class compression_kind {
    none,
    gzip,
    bzip2,
    zip,
};

enum class container_kind {
    tar,
    zip,
};

constexpr container_kind container_of(compression_kind k) noexcept {
    return k == compression_kind::zip ? container_kind::zip : container_kind::tar;
}

/// The conventional short name of a compression kind: "tar", "gz", "bz2", or "zip"
std::string_view short_name(compression_kind) noexcept;

/**
 * @brief Parse a user-provided compression name.
 *
 * Accepts "tar" and "" (both plain tar), "gz", "bz2", and "zip". Any other name fails with
 * e_unsupported_format.
 */
[[nodiscard]] result<compression_kind> parse_compression(std::string_view name) noexcept;

/**
 * @brief Determine the compression kind implied by a filename's extension, if any.
 */
std::optional<compression_kind> compression_from_filename(std::string_view filename) noexcept;

/**
 * @brief Determine the compression kind by inspecting the leading bytes of a stream.
 *
 * A "ustar" tar header is checked first, since a tar's leading bytes are its first member's name.
 * Then gzip (1F 8B), bzip2 ("BZh"), and the zip record signatures are checked.
 *
 * The stream's read position is restored before returning. Streams that cannot report or restore
 * their position are not inspected, and yield nullopt.
 */
std::optional<compression_kind> compression_from_magic(std::istream&) noexcept;

/**
 * @brief Detect the compression kind of an archive stream.
 *
 * A magic number in the stream's leading bytes is authoritative. If the bytes are unrecognized or
 * cannot be read, the filename hint's extension is used. If neither identifies the format,
 * `default_` is returned.
 *
 * @param strm The stream to inspect. Its read position is left unchanged.
 * @param filename_hint The name of the file backing the stream, or empty if unknown
 * @param default_ The kind to assume if nothing matches
 */
compression_kind sniff_compression(std::istream&    strm,
                                   std::string_view filename_hint,
                                   compression_kind default_ = compression_kind::none) noexcept;

/**
 * @brief Strip archive extensions from a filename, giving a name fit for the expanded directory.
 *
 * "backup.tar.gz" becomes "backup", "notes.zip" becomes "notes".
 */
std::string_view strip_archive_extensions(std::string_view filename) noexcept;

}  // namespace tmpdir
