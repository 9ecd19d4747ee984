#pragma once

#include "./path.hpp"

namespace tmpdir {

/**
 * @brief Change the process's working directory for the lifetime of this object.
 *
 * The previous working directory is restored on destruction. The working directory is global
 * process state: scopes must be destroyed in the reverse order of their creation, and must not be
 * used concurrently from multiple threads.
 */
class cwd_scope {
    fs::path _previous;

public:
    /// Throws std::filesystem::filesystem_error if the directory cannot be entered
    explicit cwd_scope(path_ref dir);
    ~cwd_scope();

    cwd_scope(const cwd_scope&) = delete;
    cwd_scope& operator=(const cwd_scope&) = delete;

    path_ref previous() const noexcept { return _previous; }
};

}  // namespace tmpdir
