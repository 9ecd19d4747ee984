#include "./shutil.hpp"

#include <tmpdir/error/on_error.hpp>
#include <tmpdir/error/result.hpp>
#include <tmpdir/util/log.hpp>

#include <cstdint>
#include <system_error>

using namespace tmpdir;

result<void> tmpdir::ensure_absent(path_ref path) noexcept {
    TMPDIR_E_SCOPE(e_remove_file{path});
    std::error_code ec;
    const auto      n_removed = fs::remove_all(path, ec);
    // A parent that vanished underneath us means the path is gone too
    if (ec && ec != std::errc::no_such_file_or_directory) {
        tmpdir_log(debug, "Failed to remove [{}]: {}", path.string(), ec.message());
        return new_error(ec);
    }
    if (n_removed != static_cast<std::uintmax_t>(-1)) {
        tmpdir_log(trace, "Removed [{}] ({} entries)", path.string(), n_removed);
    }
    return {};
}

result<void> tmpdir::remove_file(path_ref path) noexcept {
    TMPDIR_E_SCOPE(e_remove_file{path});
    std::error_code ec;
    auto            removed = fs::remove(path, ec);
    if (ec) {
        return new_error(ec);
    }
    if (!removed) {
        return new_error(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return {};
}

result<void> tmpdir::create_directories(path_ref dirpath) noexcept {
    TMPDIR_E_SCOPE(e_create_directory{dirpath});
    std::error_code ec;
    fs::create_directories(dirpath, ec);
    if (ec) {
        return new_error(ec);
    }
    return {};
}

result<void> tmpdir::rename_file(path_ref source, path_ref dest) noexcept {
    std::error_code ec;
    TMPDIR_E_SCOPE(e_move_file{source, dest});
    fs::rename(source, dest, ec);
    if (ec) {
        return new_error(ec);
    }
    return {};
}
