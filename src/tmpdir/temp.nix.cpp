#include "./temp.hpp"

#ifndef _WIN32

#include <tmpdir/error/on_error.hpp>
#include <tmpdir/error/result.hpp>
#include <tmpdir/util/fs/shutil.hpp>

#include <stdlib.h>

#include <cerrno>
#include <string>
#include <system_error>

using namespace tmpdir;

result<fs::path> tmpdir::create_unique_directory(path_ref parent, std::string_view prefix) noexcept {
    TMPDIR_E_SCOPE(e_create_directory{parent});
    BOOST_LEAF_CHECK(tmpdir::create_directories(parent));

    auto        file         = (parent / (std::string(prefix) + "XXXXXX")).string();
    const char* tempdir_path = ::mkdtemp(file.data());
    if (tempdir_path == nullptr) {
        return new_error(std::error_code(errno, std::system_category()));
    }
    return fs::path(tempdir_path);
}

temporary_dir temporary_dir::create_in(path_ref base) {
    auto path = create_unique_directory(base).value();
    return std::make_shared<impl>(std::move(path));
}

#endif
