#include "./writer.hpp"

#include "./archive_error.hpp"

#include <tmpdir/util/log.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <magic_enum.hpp>
#include <neo/assert.hpp>

#include <algorithm>
#include <array>
#include <ctime>
#include <istream>
#include <ostream>
#include <string>

using namespace tmpdir;

namespace {

struct entry_deleter {
    void operator()(struct archive_entry* e) const noexcept { ::archive_entry_free(e); }
};

using unique_entry = std::unique_ptr<struct archive_entry, entry_deleter>;

unique_entry make_entry(std::string_view relpath, unsigned filetype, int perm, std::int64_t size) {
    unique_entry entry{::archive_entry_new()};
    neo_assert(invariant, entry != nullptr, "archive_entry_new() failed to allocate");
    const std::string path{relpath};
    ::archive_entry_set_pathname_utf8(entry.get(), path.c_str());
    ::archive_entry_set_filetype(entry.get(), filetype);
    ::archive_entry_set_perm(entry.get(), perm);
    ::archive_entry_set_size(entry.get(), size);
    ::archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
    return entry;
}

}  // namespace

struct archive_writer::state {
    std::ostream&    strm;
    compression_kind kind;
    bool             finished = false;

    std::unique_ptr<struct archive, detail::archive_write_deleter> handle{::archive_write_new()};
    std::array<char, 64 * 1024>                                    buffer{};

    state(std::ostream& s, compression_kind k)
        : strm(s)
        , kind(k) {}

    static la_ssize_t write_cb(struct archive* a, void* client, const void* data, size_t len) {
        auto& self = *static_cast<state*>(client);
        self.strm.write(static_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!self.strm) {
            ::archive_set_error(a, EIO, "Failed to write to the output stream");
            return -1;
        }
        return static_cast<la_ssize_t>(len);
    }

    static int close_cb(struct archive* a, void* client) {
        auto& self = *static_cast<state*>(client);
        self.strm.flush();
        if (!self.strm) {
            ::archive_set_error(a, EIO, "Failed to flush the output stream");
            return ARCHIVE_FATAL;
        }
        return ARCHIVE_OK;
    }
};

archive_writer::archive_writer(std::unique_ptr<state> st) noexcept
    : _state(std::move(st)) {}

archive_writer::archive_writer(archive_writer&&) noexcept = default;
archive_writer& archive_writer::operator=(archive_writer&&) noexcept = default;

archive_writer::~archive_writer() {
    if (_state && !_state->finished) {
        tmpdir_log(debug, "Archive writer destroyed before finish(). The output is incomplete.");
    }
}

archive_writer archive_writer::open(std::ostream& strm, compression_kind kind) {
    auto  st = std::make_unique<state>(strm, kind);
    auto* a  = st->handle.get();
    neo_assert(invariant, a != nullptr, "archive_write_new() failed to allocate");

    tmpdir_log(debug, "Opening archive output stream as [{}]", magic_enum::enum_name(kind));
    switch (container_of(kind)) {
    case container_kind::tar:
        detail::check_archive_rc(a,
                                 ::archive_write_set_format_pax_restricted(a),
                                 "Select tar output format");
        break;
    case container_kind::zip:
        detail::check_archive_rc(a, ::archive_write_set_format_zip(a), "Select zip output format");
        break;
    }
    switch (kind) {
    case compression_kind::gzip:
        detail::check_archive_rc(a, ::archive_write_add_filter_gzip(a), "Enable gzip output");
        break;
    case compression_kind::bzip2:
        detail::check_archive_rc(a, ::archive_write_add_filter_bzip2(a), "Enable bzip2 output");
        break;
    case compression_kind::none:
    case compression_kind::zip:
        detail::check_archive_rc(a, ::archive_write_add_filter_none(a), "Select raw output");
        break;
    }
    // Do not pad the final block: the output is a stream, not a tape
    detail::check_archive_rc(a, ::archive_write_set_bytes_in_last_block(a, 1), "Set block padding");
    detail::check_archive_rc(a,
                             ::archive_write_open(a,
                                                  st.get(),
                                                  nullptr,
                                                  &state::write_cb,
                                                  &state::close_cb),
                             "Open archive output stream");
    return archive_writer{std::move(st)};
}

void archive_writer::add_directory(std::string_view relpath) {
    tmpdir_log(trace, "Archiving directory [{}]", relpath);
    auto* a     = _state->handle.get();
    auto  entry = make_entry(relpath, AE_IFDIR, 0755, 0);
    detail::check_archive_rc(a, ::archive_write_header(a, entry.get()), "Write directory header");
}

void archive_writer::add_file(std::string_view relpath, std::istream& content, std::int64_t size) {
    tmpdir_log(trace, "Archiving file [{}] ({} bytes)", relpath, size);
    auto* a     = _state->handle.get();
    auto  entry = make_entry(relpath, AE_IFREG, 0644, size);
    detail::check_archive_rc(a, ::archive_write_header(a, entry.get()), "Write file header");

    std::int64_t remaining = size;
    auto&        buf       = _state->buffer;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(
            std::min<std::int64_t>(remaining, static_cast<std::int64_t>(buf.size())));
        content.read(buf.data(), want);
        auto got = content.gcount();
        if (got <= 0) {
            ::archive_set_error(a,
                                EIO,
                                "File content ended %lld bytes before its recorded size",
                                static_cast<long long>(remaining));
            detail::throw_archive_error(a, "Read file content for archiving");
        }
        auto written = ::archive_write_data(a, buf.data(), static_cast<size_t>(got));
        if (written < 0) {
            detail::throw_archive_error(a, "Write file data");
        }
        remaining -= got;
    }
    detail::check_archive_rc(a, ::archive_write_finish_entry(a), "Finish file member");
}

void archive_writer::finish() {
    if (_state->finished) {
        return;
    }
    auto* a = _state->handle.get();
    detail::check_archive_rc(a, ::archive_write_close(a), "Finish archive output");
    _state->finished = true;
}
