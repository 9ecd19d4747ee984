#include "./reader.hpp"

#include "./archive_error.hpp"

#include <tmpdir/util/log.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <magic_enum.hpp>
#include <neo/assert.hpp>

#include <array>
#include <cstdio>
#include <istream>
#include <ostream>

using namespace tmpdir;

struct archive_reader::state {
    std::istream&  strm;
    std::streampos origin;
    bool           seekable    = false;
    bool           have_member = false;

    std::unique_ptr<struct archive, detail::archive_read_deleter> handle{::archive_read_new()};
    /// Handed to libarchive by read_cb. Unfiltered members are served straight out of it.
    std::array<char, 64 * 1024> input_buffer{};
    /// Destination for member data. Must never alias input_buffer.
    std::array<char, 64 * 1024> data_buffer{};

    explicit state(std::istream& s)
        : strm(s)
        , origin(s.tellg()) {
        seekable = origin != std::streampos(-1);
        if (!seekable) {
            strm.clear();
        }
    }

    static la_ssize_t read_cb(struct archive* a, void* client, const void** out) {
        auto& self = *static_cast<state*>(client);
        if (self.strm.bad()) {
            ::archive_set_error(a, EIO, "The input stream is in an unreadable state");
            return -1;
        }
        self.strm.read(self.input_buffer.data(),
                       static_cast<std::streamsize>(self.input_buffer.size()));
        auto nread = self.strm.gcount();
        if (self.strm.bad()) {
            ::archive_set_error(a, EIO, "Failed to read from the input stream");
            return -1;
        }
        *out = self.input_buffer.data();
        return static_cast<la_ssize_t>(nread);
    }

    static la_int64_t seek_cb(struct archive* a, void* client, la_int64_t offset, int whence) {
        auto& self = *static_cast<state*>(client);
        self.strm.clear();
        switch (whence) {
        case SEEK_SET:
            self.strm.seekg(self.origin + static_cast<std::streamoff>(offset));
            break;
        case SEEK_CUR:
            self.strm.seekg(static_cast<std::streamoff>(offset), std::ios::cur);
            break;
        case SEEK_END:
            self.strm.seekg(static_cast<std::streamoff>(offset), std::ios::end);
            break;
        default:
            ::archive_set_error(a, EINVAL, "Invalid seek origin");
            return ARCHIVE_FATAL;
        }
        auto pos = self.strm.tellg();
        if (!self.strm || pos == std::streampos(-1)) {
            ::archive_set_error(a, EIO, "Failed to seek within the input stream");
            return ARCHIVE_FATAL;
        }
        return static_cast<la_int64_t>(pos - self.origin);
    }
};

archive_reader::archive_reader(std::unique_ptr<state> st) noexcept
    : _state(std::move(st)) {}

archive_reader::archive_reader(archive_reader&&) noexcept = default;
archive_reader& archive_reader::operator=(archive_reader&&) noexcept = default;
archive_reader::~archive_reader()                                    = default;

archive_reader archive_reader::open(std::istream& strm, compression_kind kind) {
    auto  st = std::make_unique<state>(strm);
    auto* a  = st->handle.get();
    neo_assert(invariant, a != nullptr, "archive_read_new() failed to allocate");

    tmpdir_log(debug, "Opening archive stream as [{}]", magic_enum::enum_name(kind));
    switch (container_of(kind)) {
    case container_kind::tar:
        detail::check_archive_rc(a, ::archive_read_support_format_tar(a), "Enable tar reading");
        break;
    case container_kind::zip:
        detail::check_archive_rc(a, ::archive_read_support_format_zip(a), "Enable zip reading");
        break;
    }
    switch (kind) {
    case compression_kind::gzip:
        detail::check_archive_rc(a, ::archive_read_support_filter_gzip(a), "Enable gzip reading");
        break;
    case compression_kind::bzip2:
        detail::check_archive_rc(a, ::archive_read_support_filter_bzip2(a), "Enable bzip2 reading");
        break;
    case compression_kind::none:
    case compression_kind::zip:
        detail::check_archive_rc(a, ::archive_read_support_filter_none(a), "Enable raw reading");
        break;
    }

    if (st->seekable) {
        detail::check_archive_rc(a,
                                 ::archive_read_set_seek_callback(a, &state::seek_cb),
                                 "Set up archive seeking");
    }
    detail::check_archive_rc(a,
                             ::archive_read_open(a, st.get(), nullptr, &state::read_cb, nullptr),
                             "Open archive stream");
    return archive_reader{std::move(st)};
}

std::optional<archive_member> archive_reader::next() {
    auto*                 a     = _state->handle.get();
    struct archive_entry* entry = nullptr;
    const int             rc    = ::archive_read_next_header(a, &entry);
    if (rc == ARCHIVE_EOF) {
        _state->have_member = false;
        return std::nullopt;
    }
    detail::check_archive_rc(a, rc, "Read archive member header");
    _state->have_member = true;

    const char* pathname = ::archive_entry_pathname_utf8(entry);
    if (pathname == nullptr) {
        pathname = ::archive_entry_pathname(entry);
    }
    if (pathname == nullptr) {
        ::archive_set_error(a, EILSEQ, "Archive member has no usable path name");
        detail::throw_archive_error(a, "Read archive member header");
    }

    archive_member ret;
    ret.path = pathname;
    ret.size = ::archive_entry_size(entry);
    if (::archive_entry_hardlink(entry) != nullptr) {
        ret.kind = member_kind::other;
    } else {
        switch (::archive_entry_filetype(entry)) {
        case AE_IFREG:
            ret.kind = member_kind::file;
            break;
        case AE_IFDIR:
            ret.kind = member_kind::directory;
            break;
        default:
            ret.kind = member_kind::other;
            break;
        }
    }
    tmpdir_log(trace, "Archive member [{}] ({})", ret.path, magic_enum::enum_name(ret.kind));
    return ret;
}

void archive_reader::copy_data_to(std::ostream& out) {
    neo_assert(expects,
               _state->have_member,
               "copy_data_to() requires a current member. Call next() first.");
    auto* a = _state->handle.get();
    while (true) {
        auto& buf   = _state->data_buffer;
        auto  nread = ::archive_read_data(a, buf.data(), buf.size());
        if (nread == 0) {
            break;
        }
        if (nread < 0) {
            detail::throw_archive_error(a, "Read archive member data");
        }
        out.write(buf.data(), static_cast<std::streamsize>(nread));
        if (!out) {
            ::archive_set_error(a, EIO, "Failed to write extracted data");
            detail::throw_archive_error(a, "Extract archive member data");
        }
    }
}
