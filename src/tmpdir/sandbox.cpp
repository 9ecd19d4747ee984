#include "./sandbox.hpp"

#include <tmpdir/archive/writer.hpp>
#include <tmpdir/config.hpp>
#include <tmpdir/error/errors.hpp>
#include <tmpdir/error/handle.hpp>
#include <tmpdir/error/on_error.hpp>
#include <tmpdir/error/result.hpp>
#include <tmpdir/random_name.hpp>
#include <tmpdir/temp.hpp>
#include <tmpdir/util/fs/io.hpp>
#include <tmpdir/util/fs/shutil.hpp>
#include <tmpdir/util/log.hpp>

#include <boost/leaf.hpp>
#include <magic_enum.hpp>
#include <neo/assert.hpp>
#include <neo/scope.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <functional>
#include <istream>
#include <ostream>
#include <tuple>

using namespace tmpdir;

struct sandbox_dir::impl {
    /// The unique directory created to hold the root
    fs::path outer;
    /// outer / display_name
    fs::path      root;
    std::string   display_name;
    secure_eraser eraser;
    bool          closed = false;

    impl(fs::path outer_, std::string name, secure_eraser er)
        : outer(std::move(outer_))
        , root(outer / name)
        , display_name(std::move(name))
        , eraser(std::move(er)) {}

    impl(const impl&) = delete;

    ~impl() {
        if (closed) {
            return;
        }
        boost::leaf::try_catch([&] { close(); },
                               [&](const boost::leaf::verbose_diagnostic_info& info) {
                                   log_unhandled_error(neo::ufmt("Failed to delete sandbox [{}]",
                                                                 root.string()),
                                                       info);
                               });
    }

    void close() {
        if (closed) {
            return;
        }
        // Relocate to a fresh location on the same filesystem, so the rename is atomic
        auto relocated_parent = create_unique_directory(outer.parent_path()).value();
        auto moved            = relocate(relocated_parent);
        closed                = true;
        tmpdir_log(debug,
                   "Sandbox [{}] moved to [{}] for deletion ({})",
                   root.string(),
                   moved.string(),
                   user_facing_name(eraser.policy()));

        auto erase_moved = eraser.erase(relocated_parent);
        auto erase_outer = eraser.erase(outer);
        erase_moved.value();
        erase_outer.value();
    }

    fs::path relocate(path_ref new_parent) {
        bool did_move = false;
        // If nothing was moved, the sandbox stays open so that a later close() can retry
        neo_defer {
            if (!did_move) {
                std::ignore = ensure_absent(new_parent);
            }
        };
        name_generator names;
        auto           dest = unused_sibling_name(names, new_parent).value();
        rename_file(root, dest).value();
        did_move = true;
        return dest;
    }
};

namespace {

std::string choose_display_name(const sandbox_options& opts, std::string_view filename_hint) {
    if (opts.display_name) {
        return *opts.display_name;
    }
    auto stem = std::string(strip_archive_extensions(filename_hint));
    if (stem.empty() || stem == "." || stem == "..") {
        return config::display_name;
    }
    return stem;
}

void check_display_name(const std::string& name) {
    const fs::path as_path{name};
    if (name.empty() || as_path.has_root_path() || as_path.has_parent_path() || name == "."
        || name == "..") {
        BOOST_LEAF_THROW_EXCEPTION(std::invalid_argument(neo::ufmt(
                                       "Sandbox name [{}] must be a single path element", name)),
                                   e_invalid_display_name{name});
    }
}

}  // namespace

sandbox_dir::sandbox_dir(std::unique_ptr<impl> p) noexcept
    : _impl(std::move(p)) {}

sandbox_dir::sandbox_dir(sandbox_dir&&) noexcept = default;
sandbox_dir& sandbox_dir::operator=(sandbox_dir&&) noexcept = default;
sandbox_dir::~sandbox_dir()                                 = default;

sandbox_dir sandbox_dir::create(const sandbox_options& opts) {
    auto name = opts.display_name.value_or(config::display_name);
    check_display_name(name);

    // Resolve the policy first, so a missing wipe program fails before anything is created
    auto eraser = secure_eraser::for_policy(opts.policy).value();

    auto parent = fs::absolute(opts.parent_dir.value_or(fs::temp_directory_path()));
    auto outer  = create_unique_directory(parent).value();

    std::error_code ec;
    fs::create_directory(outer / name, ec);
    if (ec) {
        tmpdir_log(debug, "Failed to create sandbox root in [{}]: {}", outer.string(), ec.message());
        auto cleanup = ensure_absent(outer);
        if (!cleanup) {
            tmpdir_log(error, "Failed to remove partially-created sandbox [{}]", outer.string());
        }
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to create sandbox [{}]",
                                                               (outer / name).string())),
                                   ec,
                                   e_create_directory{outer / name});
    }

    auto ptr = std::make_unique<impl>(std::move(outer), std::move(name), std::move(eraser));
    tmpdir_log(debug,
               "Created sandbox [{}] ({})",
               ptr->root.string(),
               user_facing_name(ptr->eraser.policy()));
    return sandbox_dir{std::move(ptr)};
}

sandbox_dir sandbox_dir::load(std::istream& in, const load_options& lopts, sandbox_options opts) {
    const auto kind = lopts.compression.value_or(
        sniff_compression(in, lopts.filename_hint, compression_kind::none));
    opts.display_name = choose_display_name(opts, lopts.filename_hint);

    auto sb = create(opts);
    tmpdir_log(debug,
               "Loading [{}] archive into [{}]",
               magic_enum::enum_name(kind),
               sb.path().string());

    auto reader = archive_reader::open(in, kind);
    while (auto member = reader.next()) {
        TMPDIR_E_SCOPE(e_archive_member{member->path});
        auto dest = validate_member_path(sb.path(), member->path, opts.absolute_members).value();
        switch (member->kind) {
        case member_kind::directory:
            tmpdir::create_directories(dest).value();
            break;
        case member_kind::file: {
            if (dest == sb.path()) {
                BOOST_LEAF_THROW_EXCEPTION(e_path_traversal{member->path},
                                           e_sandbox_root{sb.path()});
            }
            tmpdir::create_directories(dest.parent_path()).value();
            TMPDIR_E_SCOPE(e_write_file_path{dest});
            auto out = open_file(dest, std::ios::out | std::ios::binary | std::ios::trunc);
            reader.copy_data_to(out);
            finish_file(out, dest);
            break;
        }
        case member_kind::other:
            tmpdir_log(warn,
                       "Skipping archive member [{}]: only files and directories are extracted",
                       member->path);
            break;
        }
    }
    return sb;
}

path_ref sandbox_dir::path() const noexcept { return _impl->root; }

const std::string& sandbox_dir::display_name() const noexcept { return _impl->display_name; }

deletion_policy sandbox_dir::policy() const noexcept { return _impl->eraser.policy(); }

bool sandbox_dir::is_open() const noexcept { return _impl && !_impl->closed; }

std::vector<sandbox_entry> sandbox_dir::walk() const {
    neo_assert(expects, is_open(), "Cannot walk a closed sandbox", path().string());
    std::vector<sandbox_entry> ret;
    for (auto& entry : fs::recursive_directory_iterator{path()}) {
        auto kind = member_kind::other;
        if (!entry.is_symlink()) {
            if (entry.is_directory()) {
                kind = member_kind::directory;
            } else if (entry.is_regular_file()) {
                kind = member_kind::file;
            }
        }
        ret.push_back(sandbox_entry{entry.path().lexically_relative(path()), kind});
    }
    std::ranges::sort(ret, std::less<>{}, &sandbox_entry::relpath);
    return ret;
}

void sandbox_dir::dump(std::ostream& out, const dump_options& dopts) const {
    neo_assert(expects, is_open(), "Cannot dump a closed sandbox", path().string());
    const auto kind = dopts.compression.value_or(
        compression_from_filename(dopts.filename_hint).value_or(compression_kind::gzip));
    tmpdir_log(debug, "Dumping [{}] as [{}]", path().string(), magic_enum::enum_name(kind));

    auto writer = archive_writer::open(out, kind);
    for (auto& entry : walk()) {
        const auto member_path = entry.relpath.generic_string();
        switch (entry.kind) {
        case member_kind::directory:
            writer.add_directory(member_path);
            break;
        case member_kind::file: {
            auto full = path() / entry.relpath;
            auto size = static_cast<std::int64_t>(fs::file_size(full));
            auto in   = open_file(full, std::ios::in | std::ios::binary);
            writer.add_file(member_path, in, size);
            break;
        }
        case member_kind::other:
            tmpdir_log(warn, "Not archiving [{}]: it is not a file or directory", member_path);
            break;
        }
    }
    writer.finish();
}

std::fstream sandbox_dir::open(path_ref relpath, std::ios::openmode mode) const {
    neo_assert(expects, is_open(), "Cannot open a file in a closed sandbox", path().string());
    auto full = path() / relpath;
    tmpdir::create_directories(full.parent_path()).value();
    return open_file(full, mode);
}

cwd_scope sandbox_dir::as_cwd() const {
    neo_assert(expects, is_open(), "Cannot enter a closed sandbox", path().string());
    return cwd_scope{path()};
}

void sandbox_dir::close() {
    if (_impl) {
        _impl->close();
    }
}
