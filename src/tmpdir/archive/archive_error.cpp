#include "./archive_error.hpp"

#include <tmpdir/error/errors.hpp>
#include <tmpdir/util/log.hpp>

#include <archive.h>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <system_error>

using namespace tmpdir;

void detail::archive_read_deleter::operator()(struct archive* a) const noexcept {
    ::archive_read_free(a);
}

void detail::archive_write_deleter::operator()(struct archive* a) const noexcept {
    ::archive_write_free(a);
}

void detail::throw_archive_error(struct archive* a, std::string_view what) {
    const char* message = ::archive_error_string(a);
    std::string detail  = message ? message : "unknown archive error";
    const int   err     = ::archive_errno(a);
    auto ec = err > 0 ? std::error_code(err, std::system_category())
                      : std::make_error_code(std::errc::io_error);
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, neo::ufmt("{}: {}", what, detail)),
                               e_archive_error{detail},
                               ec);
}

void detail::check_archive_rc(struct archive* a, int rc, std::string_view what) {
    if (rc == ARCHIVE_OK) {
        return;
    }
    if (rc == ARCHIVE_WARN) {
        const char* message = ::archive_error_string(a);
        tmpdir_log(warn, "{}: {}", what, message ? message : "(no details)");
        return;
    }
    throw_archive_error(a, what);
}
