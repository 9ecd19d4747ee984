#pragma once

#include <tmpdir/error/result_fwd.hpp>
#include <tmpdir/util/fs/path.hpp>

#include <memory>
#include <string_view>

namespace tmpdir {

/**
 * @brief Atomically create a new, uniquely named directory within `parent`.
 *
 * The directory is created with owner-only permissions. Its name begins with `prefix`, followed by
 * random characters.
 */
[[nodiscard]] result<fs::path> create_unique_directory(path_ref         parent,
                                                       std::string_view prefix = "tmpdir-") noexcept;

/**
 * @brief A scratch directory that is removed (non-securely) when the last copy is destroyed.
 */
class temporary_dir {
    struct impl {
        fs::path path;
        explicit impl(path_ref p)
            : path(p) {}

        impl(const impl&) = delete;

        ~impl() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }
    };

    std::shared_ptr<impl> _ptr;

    temporary_dir(std::shared_ptr<impl> p)
        : _ptr(p) {}

public:
    static temporary_dir create_in(path_ref parent);
    static temporary_dir create() { return create_in(fs::temp_directory_path()); }

    path_ref path() const noexcept { return _ptr->path; }
};

}  // namespace tmpdir
