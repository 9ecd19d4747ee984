#include "./erase.hpp"

#ifndef _WIN32

#include <tmpdir/error/on_error.hpp>
#include <tmpdir/error/result.hpp>
#include <tmpdir/util/fs/io.hpp>

#include <neo/scope.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <system_error>

using namespace tmpdir;

namespace {

std::error_code last_errno() noexcept { return std::error_code(errno, std::system_category()); }

}  // namespace

result<void> tmpdir::overwrite_with_zeros(path_ref file) noexcept {
    TMPDIR_E_SCOPE(e_write_file_path{file});
    const int fd = ::open(file.c_str(), O_WRONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return new_error(last_errno());
    }
    neo_defer { ::close(fd); };

    struct ::stat st {};
    if (::fstat(fd, &st) != 0) {
        return new_error(last_errno());
    }
    if (!S_ISREG(st.st_mode)) {
        return new_error(std::make_error_code(std::errc::invalid_argument));
    }

    static const std::array<char, overwrite_chunk_size> zeros{};
    off_t offset = 0;
    while (offset < st.st_size) {
        const auto chunk
            = static_cast<std::size_t>(std::min<off_t>(st.st_size - offset, zeros.size()));
        auto n_written = ::pwrite(fd, zeros.data(), chunk, offset);
        if (n_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return new_error(last_errno());
        }
        if (n_written == 0) {
            return new_error(std::make_error_code(std::errc::io_error));
        }
        // Each chunk reaches the disk before the next is written
        if (::fsync(fd) != 0) {
            return new_error(last_errno());
        }
        offset += n_written;
    }
    return {};
}

#endif
