#include "./io.hpp"

#include <tmpdir/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <sstream>
#include <system_error>

using namespace tmpdir;

using path_ref = const std::filesystem::path&;

namespace {

[[noreturn]] void throw_file_error(int err, std::string_view verb, path_ref fpath) {
    // Streams do not always set errno
    auto ec = err ? std::error_code{err, std::system_category()}
                  : std::make_error_code(std::errc::io_error);
    auto what = neo::ufmt("Failed to {} [{}]", verb, fpath.string());
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, what), boost::leaf::e_errno{err}, ec);
}

}  // namespace

std::fstream tmpdir::open_file(path_ref fpath, std::ios::openmode mode) {
    TMPDIR_E_SCOPE(e_open_file_path{fpath});
    errno = 0;
    std::fstream ret{fpath, mode};
    if (!ret) {
        throw_file_error(errno, "open file", fpath);
    }
    return ret;
}

void tmpdir::finish_file(std::fstream& strm, path_ref fpath) {
    TMPDIR_E_SCOPE(e_write_file_path{fpath});
    errno = 0;
    strm.flush();
    strm.close();
    if (!strm) {
        throw_file_error(errno, "finish writing", fpath);
    }
}

void tmpdir::write_file(path_ref dest, std::string_view content) {
    TMPDIR_E_SCOPE(e_write_file_path{dest});
    auto ofile = open_file(dest, std::ios::binary | std::ios::out | std::ios::trunc);
    errno      = 0;
    ofile.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!ofile) {
        throw_file_error(errno, "write to file", dest);
    }
    finish_file(ofile, dest);
}

std::string tmpdir::read_file(path_ref path) {
    TMPDIR_E_SCOPE(e_read_file_path{path});
    auto               infile = open_file(path, std::ios::binary | std::ios::in);
    std::ostringstream out;
    errno = 0;
    // An empty file makes operator<< set failbit without reading anything
    if (infile.peek() != std::fstream::traits_type::eof()) {
        out << infile.rdbuf();
    }
    if (infile.bad() || !out) {
        throw_file_error(errno, "read file", path);
    }
    return std::move(out).str();
}
