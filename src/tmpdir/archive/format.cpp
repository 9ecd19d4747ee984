#include "./format.hpp"

#include <tmpdir/error/errors.hpp>
#include <tmpdir/error/result.hpp>

#include <array>
#include <istream>
#include <utility>

using namespace tmpdir;

namespace {

constexpr std::array<std::pair<std::string_view, compression_kind>, 9> types_by_extension = {{
    {".tar", compression_kind::none},
    {".tgz", compression_kind::gzip},
    {".gz", compression_kind::gzip},
    {".gzip", compression_kind::gzip},
    {".tbz", compression_kind::bzip2},
    {".tbz2", compression_kind::bzip2},
    {".tb2", compression_kind::bzip2},
    {".bz2", compression_kind::bzip2},
    {".zip", compression_kind::zip},
}};

/// Local file header, end of central directory (empty archive), and spanning marker
constexpr std::array<std::string_view, 3> zip_signatures = {
    std::string_view("PK\x03\x04", 4),
    std::string_view("PK\x05\x06", 4),
    std::string_view("PK\x07\x08", 4),
};

std::string_view extension_of(std::string_view filename) noexcept {
    auto slash = filename.find_last_of('/');
    if (slash != filename.npos) {
        filename.remove_prefix(slash + 1);
    }
    auto dot = filename.rfind('.');
    if (dot == filename.npos || dot == 0) {
        return {};
    }
    return filename.substr(dot);
}

std::optional<compression_kind> lookup_extension(std::string_view ext) noexcept {
    for (auto& [known, kind] : types_by_extension) {
        if (known == ext) {
            return kind;
        }
    }
    return std::nullopt;
}

/**
 * Read up to `n` bytes at `offset` from the position `start`, then put the stream back at `start`.
 * Returns the number of bytes actually read.
 */
std::streamsize peek_at(std::istream& strm, std::streampos start, std::streamoff offset, char* out,
                        std::streamsize n) {
    strm.seekg(start + offset);
    std::streamsize got = 0;
    if (strm) {
        strm.read(out, n);
        got = strm.gcount();
    }
    strm.clear();
    strm.seekg(start);
    return got;
}

}  // namespace

std::string_view tmpdir::short_name(compression_kind k) noexcept {
    switch (k) {
    case compression_kind::none:
        return "tar";
    case compression_kind::gzip:
        return "gz";
    case compression_kind::bzip2:
        return "bz2";
    case compression_kind::zip:
        return "zip";
    }
    return "unknown";
}

result<compression_kind> tmpdir::parse_compression(std::string_view name) noexcept {
    if (name.empty() || name == "tar") {
        return compression_kind::none;
    } else if (name == "gz") {
        return compression_kind::gzip;
    } else if (name == "bz2") {
        return compression_kind::bzip2;
    } else if (name == "zip") {
        return compression_kind::zip;
    }
    return new_error(e_unsupported_format{std::string(name)});
}

std::optional<compression_kind> tmpdir::compression_from_filename(std::string_view fname) noexcept {
    return lookup_extension(extension_of(fname));
}

std::optional<compression_kind> tmpdir::compression_from_magic(std::istream& strm) noexcept {
    try {
        if (!strm) {
            return std::nullopt;
        }
        const auto start = strm.tellg();
        if (start == std::streampos(-1)) {
            strm.clear();
            return std::nullopt;
        }

        // A POSIX tar header carries "ustar" at offset 257 of the first 512-byte block. The header
        // begins with the first member's name, which may itself look like another magic number.
        char ustar[5] = {};
        if (peek_at(strm, start, 257, ustar, 5) == 5
            && std::string_view(ustar, 5) == std::string_view("ustar")) {
            return compression_kind::none;
        }

        char       lead_buf[4] = {};
        const auto n_lead      = static_cast<std::size_t>(peek_at(strm, start, 0, lead_buf, 4));
        const auto lead        = std::string_view(lead_buf, n_lead);
        if (lead.starts_with("\x1f\x8b")) {
            return compression_kind::gzip;
        } else if (lead.starts_with("BZh")) {
            return compression_kind::bzip2;
        }
        for (auto zip_magic : zip_signatures) {
            if (lead == zip_magic) {
                return compression_kind::zip;
            }
        }
    } catch (const std::ios_base::failure&) {
        strm.clear();
    }
    return std::nullopt;
}

compression_kind tmpdir::sniff_compression(std::istream&    strm,
                                           std::string_view filename_hint,
                                           compression_kind default_) noexcept {
    // The leading bytes are what will actually be decoded, so a recognized magic number overrides a
    // misleading extension
    if (auto by_magic = compression_from_magic(strm)) {
        return *by_magic;
    }
    if (auto by_name = compression_from_filename(filename_hint)) {
        return *by_name;
    }
    return default_;
}

std::string_view tmpdir::strip_archive_extensions(std::string_view filename) noexcept {
    auto slash = filename.find_last_of('/');
    if (slash != filename.npos) {
        filename.remove_prefix(slash + 1);
    }
    while (true) {
        auto ext = extension_of(filename);
        if (ext.empty() || !lookup_extension(ext)) {
            break;
        }
        filename.remove_suffix(ext.size());
    }
    return filename;
}
