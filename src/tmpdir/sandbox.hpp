#pragma once

#include <tmpdir/archive/format.hpp>
#include <tmpdir/archive/reader.hpp>
#include <tmpdir/erase.hpp>
#include <tmpdir/path_guard.hpp>
#include <tmpdir/util/fs/cwd.hpp>
#include <tmpdir/util/fs/path.hpp>

#include <fstream>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tmpdir {

struct sandbox_options {
    /// The name of the sandbox root directory. Cosmetic only. Defaults to "tmp".
    std::optional<std::string> display_name = std::nullopt;
    /// How the sandbox's contents are destroyed when it is closed
    deletion_policy policy = deletion_policy::attempt_secure;
    /// The directory in which to create the sandbox. Defaults to the system temporary directory.
    /// A relative path is resolved against the working directory at creation.
    std::optional<fs::path> parent_dir = std::nullopt;
    /// How absolute member paths are treated when loading an archive
    absolute_member_policy absolute_members = absolute_member_policy::reject;
};

struct load_options {
    /// The compression of the input. If not given, it is sniffed, falling back to plain tar.
    std::optional<compression_kind> compression = std::nullopt;
    /// The name of the file the archive is read from, if any. Used for sniffing and for the
    /// default display name.
    std::string filename_hint = {};
};

struct dump_options {
    /// The compression of the output. If not given, it is chosen from the filename hint's
    /// extension, falling back to gzip.
    std::optional<compression_kind> compression = std::nullopt;
    std::string                     filename_hint = {};
};

/// One file or directory within a sandbox
struct sandbox_entry {
    fs::path    relpath;
    member_kind kind;
};

/**
 * @brief A uniquely named temporary directory whose contents are destroyed when it is closed.
 *
 * The directory exists from construction until `close()`. Closing first moves the directory to a
 * new random location, so that any path to the old location stops working at once, and then
 * destroys it according to the deletion policy. The destructor closes an open sandbox, logging any
 * failure; call `close()` explicitly to receive errors.
 */
class sandbox_dir {
    struct impl;
    std::unique_ptr<impl> _impl;

    explicit sandbox_dir(std::unique_ptr<impl>) noexcept;

public:
    sandbox_dir(sandbox_dir&&) noexcept;
    sandbox_dir& operator=(sandbox_dir&&) noexcept;
    ~sandbox_dir();

    /**
     * @brief Create a new, empty sandbox.
     *
     * Throws with e_capability_unavailable if the policy is `secure` and the wipe program cannot
     * be found. On any failure, nothing is left behind on the filesystem.
     */
    [[nodiscard]] static sandbox_dir create(const sandbox_options& = {});

    /**
     * @brief Create a new sandbox and expand an archive into it.
     *
     * Every member path is checked before anything is written for it. A member that would land
     * outside of the sandbox aborts the whole load with e_path_traversal, and the partially loaded
     * sandbox is destroyed. Members that are neither files nor directories are skipped.
     */
    [[nodiscard]] static sandbox_dir
    load(std::istream& in, const load_options& = {}, sandbox_options = {});

    /// The absolute path of the sandbox root
    path_ref path() const noexcept;
    /// The name of the sandbox root directory
    const std::string& display_name() const noexcept;
    /// The effective deletion policy. Never `attempt_secure`.
    deletion_policy policy() const noexcept;
    bool            is_open() const noexcept;

    /**
     * @brief Write the current contents of the sandbox to an archive stream.
     *
     * Member paths are relative to the sandbox root. Directories are recorded as their own members,
     * so empty directories survive a round-trip.
     */
    void dump(std::ostream& out, const dump_options& = {}) const;

    /**
     * @brief Open a file within the sandbox, creating any missing parent directories.
     *
     * The path is not checked for traversal: use `load()` for untrusted input.
     */
    [[nodiscard]] std::fstream open(path_ref relpath, std::ios::openmode mode) const;

    /// List every file and directory in the sandbox, parents before children
    [[nodiscard]] std::vector<sandbox_entry> walk() const;

    /// Make the sandbox root the working directory until the returned scope is destroyed
    [[nodiscard]] cwd_scope as_cwd() const;

    /**
     * @brief Destroy the sandbox. Calling this on a closed sandbox does nothing.
     *
     * On failure, throws with e_deletion_failed. The sandbox is considered closed once it has been
     * moved away from its original path, even if destroying it then fails.
     */
    void close();
};

/**
 * @brief Run `fn` with the sandbox root as the working directory, then close the sandbox.
 *
 * The previous working directory is restored and the sandbox is closed on every exit path. If `fn`
 * throws, a failure to close is logged and the original exception propagates.
 */
template <typename Func>
decltype(auto) with_sandbox(sandbox_dir&& sb_, Func&& fn) {
    sandbox_dir sb = std::move(sb_);
    using ret_t    = std::invoke_result_t<Func&, sandbox_dir&>;
    if constexpr (std::is_void_v<ret_t>) {
        {
            auto cwd = sb.as_cwd();
            fn(sb);
        }
        sb.close();
    } else {
        std::remove_cvref_t<ret_t> ret = [&]() -> ret_t {
            auto cwd = sb.as_cwd();
            return fn(sb);
        }();
        sb.close();
        return ret;
    }
}

}  // namespace tmpdir
