#include "./sandbox.hpp"

#include <tmpdir/archive/writer.hpp>
#include <tmpdir/error/errors.hpp>
#include <tmpdir/temp.hpp>
#include <tmpdir/tmpdir.test.hpp>
#include <tmpdir/util/fs/cwd.hpp>
#include <tmpdir/util/fs/io.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <boost/leaf.hpp>
#include <catch2/catch.hpp>

#include <cstdlib>
#include <sstream>
#include <tuple>
#include <utility>

using namespace tmpdir;

namespace {

std::string read_sandbox_file(const sandbox_dir& sb, path_ref relpath) {
    return read_file(sb.path() / relpath);
}

/// Build a tar archive holding the given (path, content) pairs. Paths are not checked.
std::string make_tar(std::initializer_list<std::pair<std::string_view, std::string_view>> files) {
    std::stringstream buf;
    auto              writer = archive_writer::open(buf, compression_kind::none);
    for (auto [path, content] : files) {
        std::istringstream in{std::string(content)};
        writer.add_file(path, in, static_cast<std::int64_t>(content.size()));
    }
    writer.finish();
    return buf.str();
}

/// All paths beneath a directory, recursively
std::vector<fs::path> list_tree(path_ref dir) {
    std::vector<fs::path> ret;
    for (auto& entry : fs::recursive_directory_iterator{dir}) {
        ret.push_back(entry.path().lexically_relative(dir));
    }
    return ret;
}

}  // namespace

TEST_CASE("Create and close a sandbox") {
    auto policy = GENERATE(deletion_policy::pass_through,
                           deletion_policy::pseudo_secure,
                           deletion_policy::attempt_secure);
    INFO("Policy: " << user_facing_name(policy));
    auto scratch = temporary_dir::create();

    auto sb = sandbox_dir::create({.policy = policy, .parent_dir = scratch.path()});
    CHECK(sb.is_open());
    CHECK(sb.display_name() == "tmp");
    CHECK(sb.path().filename() == "tmp");
    CHECK(sb.policy() != deletion_policy::attempt_secure);
    CHECK(path_is_within(scratch.path(), sb.path()));
    REQUIRE(fs::is_directory(sb.path()));
    CHECK(fs::is_empty(sb.path()));

    auto f = sb.open("sub/file.txt", std::ios::out | std::ios::binary);
    f << "Some data";
    f.close();

    const auto root = sb.path();
    sb.close();
    CHECK_FALSE(sb.is_open());
    CHECK_FALSE(fs::exists(root));
    // Neither the sandbox nor anything created to destroy it remains
    CHECK(testing::list_dir(scratch.path()).empty());
}

TEST_CASE("An invalid display name is not reported as path traversal") {
    auto scratch = temporary_dir::create();
    boost::leaf::try_catch(
        [&] {
            std::ignore = sandbox_dir::create({.display_name = "a/b",
                                               .policy       = deletion_policy::pass_through,
                                               .parent_dir   = scratch.path()});
            FAIL("Expected create() to fail");
        },
        [](e_path_traversal) { FAIL("Display name reported as a path traversal"); },
        [](e_invalid_display_name e) { CHECK(e.value == "a/b"); },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected failure: " << info);
        });
}

TEST_CASE("A relative parent directory gives an absolute sandbox root") {
    auto       scratch = temporary_dir::create();
    cwd_scope  in_scratch{scratch.path()};
    const auto parent = fs::current_path() / "relative";
    fs::create_directory(parent);

    fs::path root;
    auto     entries = with_sandbox(sandbox_dir::create({.policy     = deletion_policy::pass_through,
                                                         .parent_dir = "relative"}),
                                [&](sandbox_dir& sb) {
                                    root = sb.path();
                                    CHECK(root.is_absolute());
                                    CHECK(path_is_within(parent, root));
                                    write_file("f.txt", "Written from inside");
                                    CHECK(fs::exists(root / "f.txt"));
                                    return sb.walk();
                                });
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].relpath == "f.txt");
    CHECK(entries[0].kind == member_kind::file);
    CHECK_FALSE(fs::exists(root));
}

TEST_CASE("Create a sandbox with the external wipe program") {
    auto scratch = temporary_dir::create();
    auto script  = scratch.path() / "fake-wipe";
    write_file(script, "#!/bin/sh\nshift 2\nrm -rf -- \"$@\"\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
    ::setenv("TMPDIR_WIPE_PROGRAM", script.c_str(), 1);
    auto sb = sandbox_dir::create(
        {.policy = deletion_policy::secure, .parent_dir = scratch.path() / "sandboxes"});
    ::unsetenv("TMPDIR_WIPE_PROGRAM");

    CHECK(sb.policy() == deletion_policy::secure);
    write_file(sb.path() / "file.txt", "Data");
    const auto root = sb.path();
    sb.close();
    CHECK_FALSE(fs::exists(root));
    CHECK(testing::list_dir(scratch.path() / "sandboxes").empty());
}

TEST_CASE("Closing twice is harmless") {
    auto scratch = temporary_dir::create();
    auto sb      = sandbox_dir::create(
        {.policy = deletion_policy::pseudo_secure, .parent_dir = scratch.path()});
    write_file(sb.path() / "file.txt", "Data");
    sb.close();
    sb.close();
    CHECK_FALSE(sb.is_open());
    CHECK(testing::list_dir(scratch.path()).empty());
}

TEST_CASE("The destructor closes the sandbox") {
    auto     scratch = temporary_dir::create();
    fs::path root;
    {
        auto sb = sandbox_dir::create(
            {.policy = deletion_policy::pass_through, .parent_dir = scratch.path()});
        root = sb.path();
        write_file(root / "file.txt", "Data");
    }
    CHECK_FALSE(fs::exists(root));
    CHECK(testing::list_dir(scratch.path()).empty());
}

TEST_CASE("A moved-from sandbox does not close") {
    auto scratch = temporary_dir::create();
    auto sb      = sandbox_dir::create(
        {.policy = deletion_policy::pass_through, .parent_dir = scratch.path()});
    auto other = std::move(sb);
    CHECK_FALSE(sb.is_open());
    sb.close();
    CHECK(other.is_open());
    CHECK(fs::is_directory(other.path()));
}

TEST_CASE("Reject display names that are not a single path element") {
    auto name = GENERATE(as<std::string>{}, "", "..", "a/b", "/abs");
    INFO("Name: [" << name << "]");
    auto scratch = temporary_dir::create();
    CHECK_THROWS_AS(sandbox_dir::create({.display_name = name,
                                         .policy       = deletion_policy::pass_through,
                                         .parent_dir   = scratch.path()}),
                    std::invalid_argument);
    CHECK(testing::list_dir(scratch.path()).empty());
}

TEST_CASE("Dump and load a sandbox") {
    auto scratch = temporary_dir::create();
    sandbox_options opts{.policy = deletion_policy::pass_through, .parent_dir = scratch.path()};

    std::stringstream archive;
    {
        auto sb = sandbox_dir::create(opts);
        auto f  = sb.open("a/b.txt", std::ios::out | std::ios::binary);
        f << "hello";
        f.close();
        sb.dump(archive, {.compression = compression_kind::none});
        sb.close();
    }

    auto loaded = sandbox_dir::load(archive, {}, opts);
    CHECK(read_sandbox_file(loaded, "a/b.txt") == "hello");
    loaded.close();
}

TEST_CASE("Round-trip through every archive format") {
    auto kind = GENERATE(compression_kind::none,
                         compression_kind::gzip,
                         compression_kind::bzip2,
                         compression_kind::zip);
    INFO("Compression: " << short_name(kind));
    auto scratch = temporary_dir::create();
    sandbox_options opts{.policy = deletion_policy::pass_through, .parent_dir = scratch.path()};

    std::string binary_content;
    for (int i = 0; i < 70000; ++i) {
        binary_content.push_back(static_cast<char>(i * 7 % 256));
    }

    auto sb = sandbox_dir::create(opts);
    write_file(sb.path() / "top.txt", "Top level");
    fs::create_directories(sb.path() / "empty/nested");
    fs::create_directories(sb.path() / "data");
    write_file(sb.path() / "data/blob.bin", binary_content);
    write_file(sb.path() / "data/empty.txt", "");

    std::stringstream archive;
    sb.dump(archive, {.compression = kind});
    const auto original = sb.walk();
    sb.close();

    // The format is sniffed from the content
    auto loaded = sandbox_dir::load(archive, {}, opts);
    auto walked = loaded.walk();
    REQUIRE(walked.size() == original.size());
    for (std::size_t i = 0; i < walked.size(); ++i) {
        CHECK(walked[i].relpath == original[i].relpath);
        CHECK(walked[i].kind == original[i].kind);
    }
    CHECK(read_sandbox_file(loaded, "top.txt") == "Top level");
    CHECK(read_sandbox_file(loaded, "data/blob.bin") == binary_content);
    CHECK(read_sandbox_file(loaded, "data/empty.txt") == "");
    CHECK(fs::is_directory(loaded.path() / "empty/nested"));
}

TEST_CASE("Choose the dump format from the file name") {
    auto scratch = temporary_dir::create();
    auto sb      = sandbox_dir::create(
        {.policy = deletion_policy::pass_through, .parent_dir = scratch.path()});
    write_file(sb.path() / "file.txt", "Data");

    std::stringstream as_bz2;
    sb.dump(as_bz2, {.filename_hint = "out.tar.bz2"});
    CHECK(compression_from_magic(as_bz2) == compression_kind::bzip2);

    std::stringstream as_default;
    sb.dump(as_default);
    CHECK(compression_from_magic(as_default) == compression_kind::gzip);
}

TEST_CASE("Load a tar whose first member name resembles a zip header") {
    auto hint = GENERATE(as<std::string>{}, "", "pkg.tar");
    INFO("Filename hint: [" << hint << "]");
    auto scratch = temporary_dir::create();

    std::stringstream archive{make_tar({{"PKGBUILD", "pkgname=demo\n"}, {"src/main.c", "int x;"}})};
    auto              sb = sandbox_dir::load(archive,
                                {.filename_hint = hint},
                                {.policy = deletion_policy::pass_through, .parent_dir = scratch.path()});
    CHECK(read_sandbox_file(sb, "PKGBUILD") == "pkgname=demo\n");
    CHECK(read_sandbox_file(sb, "src/main.c") == "int x;");
}

TEST_CASE("Derive the display name from the archive file name") {
    auto scratch = temporary_dir::create();
    sandbox_options opts{.policy = deletion_policy::pass_through, .parent_dir = scratch.path()};

    std::stringstream archive;
    sandbox_dir::create(opts).dump(archive, {.compression = compression_kind::gzip});

    SECTION("From the hint") {
        auto sb = sandbox_dir::load(archive, {.filename_hint = "/backups/project.tar.gz"}, opts);
        CHECK(sb.display_name() == "project");
        CHECK(sb.path().filename() == "project");
    }
    SECTION("An explicit name wins") {
        opts.display_name = "explicit";
        auto sb = sandbox_dir::load(archive, {.filename_hint = "project.tgz"}, opts);
        CHECK(sb.display_name() == "explicit");
    }
    SECTION("No hint") {
        auto sb = sandbox_dir::load(archive, {}, opts);
        CHECK(sb.display_name() == "tmp");
    }
}

TEST_CASE("Abort loading an archive that escapes the sandbox") {
    auto scratch   = temporary_dir::create();
    auto sandboxes = scratch.path() / "sandboxes";
    std::stringstream archive{make_tar({{"good.txt", "Fine"}, {"../evil.txt", "Gotcha"}})};

    boost::leaf::try_catch(
        [&] {
            auto sb = sandbox_dir::load(archive,
                                        {},
                                        {.policy     = deletion_policy::pass_through,
                                         .parent_dir = sandboxes});
            FAIL("Expected the load to fail, but it created [" << sb.path().string() << "]");
        },
        [](e_path_traversal e, e_archive_member member) {
            CHECK(e.value == "../evil.txt");
            CHECK(member.value == "../evil.txt");
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected failure: " << info);
        });

    // The partial sandbox was destroyed, and nothing was written beside it
    CHECK(list_tree(scratch.path()) == std::vector<fs::path>{"sandboxes"});
}

TEST_CASE("Absolute member paths") {
    auto scratch = temporary_dir::create();
    auto tar     = make_tar({{"/abs/file.txt", "Absolute"}});

    SECTION("Are rejected by default") {
        std::stringstream archive{tar};
        boost::leaf::try_catch(
            [&] {
                std::ignore = sandbox_dir::load(archive,
                                                {},
                                                {.policy     = deletion_policy::pass_through,
                                                 .parent_dir = scratch.path()});
                FAIL("Expected the load to fail");
            },
            [](e_path_traversal e) { CHECK(e.value == "/abs/file.txt"); },
            [](const boost::leaf::verbose_diagnostic_info& info) {
                FAIL("Unexpected failure: " << info);
            });
        CHECK(testing::list_dir(scratch.path()).empty());
    }
    SECTION("Are placed beneath the root on request") {
        std::stringstream archive{tar};
        auto              sb = sandbox_dir::load(archive,
                                    {},
                                    {.policy           = deletion_policy::pass_through,
                                     .parent_dir       = scratch.path(),
                                     .absolute_members = absolute_member_policy::reroot});
        CHECK(read_sandbox_file(sb, "abs/file.txt") == "Absolute");
    }
}

TEST_CASE("Skip symlink members") {
    auto scratch = temporary_dir::create();
    auto outside = scratch.path() / "outside";
    fs::create_directories(outside);

    // archive_writer only writes files and directories, so build this one by hand
    std::string buf(64 * 1024, '\0');
    size_t      used = 0;
    {
        auto* a = ::archive_write_new();
        REQUIRE(a);
        ::archive_write_set_format_pax_restricted(a);
        ::archive_write_add_filter_none(a);
        REQUIRE(::archive_write_open_memory(a, buf.data(), buf.size(), &used) == ARCHIVE_OK);

        auto* entry = ::archive_entry_new();
        ::archive_entry_set_pathname(entry, "link");
        ::archive_entry_set_filetype(entry, AE_IFLNK);
        ::archive_entry_set_perm(entry, 0777);
        ::archive_entry_set_symlink(entry, outside.c_str());
        REQUIRE(::archive_write_header(a, entry) == ARCHIVE_OK);
        ::archive_entry_clear(entry);

        const std::string_view content = "Payload";
        ::archive_entry_set_pathname(entry, "link/payload.txt");
        ::archive_entry_set_filetype(entry, AE_IFREG);
        ::archive_entry_set_perm(entry, 0644);
        ::archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
        REQUIRE(::archive_write_header(a, entry) == ARCHIVE_OK);
        REQUIRE(::archive_write_data(a, content.data(), content.size())
                == static_cast<la_ssize_t>(content.size()));
        ::archive_entry_free(entry);
        REQUIRE(::archive_write_close(a) == ARCHIVE_OK);
        ::archive_write_free(a);
    }
    buf.resize(used);

    std::stringstream archive{buf};
    auto              sb = sandbox_dir::load(archive,
                                {},
                                {.policy     = deletion_policy::pass_through,
                                 .parent_dir = scratch.path() / "sandboxes"});
    CHECK_FALSE(fs::is_symlink(sb.path() / "link"));
    CHECK(read_sandbox_file(sb, "link/payload.txt") == "Payload");
    CHECK(fs::is_empty(outside));
}

TEST_CASE("List the contents of a sandbox") {
    auto scratch = temporary_dir::create();
    auto sb      = sandbox_dir::create(
        {.policy = deletion_policy::pass_through, .parent_dir = scratch.path()});
    write_file(sb.path() / "b.txt", "");
    fs::create_directories(sb.path() / "a/c");
    fs::create_symlink("b.txt", sb.path() / "link");

    auto entries = sb.walk();
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].relpath == "a");
    CHECK(entries[0].kind == member_kind::directory);
    CHECK(entries[1].relpath == "a/c");
    CHECK(entries[2].relpath == "b.txt");
    CHECK(entries[2].kind == member_kind::file);
    CHECK(entries[3].relpath == "link");
    CHECK(entries[3].kind == member_kind::other);
}

TEST_CASE("Use a sandbox as the working directory") {
    auto       scratch = temporary_dir::create();
    const auto before  = fs::current_path();

    SECTION("For a scope") {
        auto sb = sandbox_dir::create(
            {.policy = deletion_policy::pass_through, .parent_dir = scratch.path()});
        {
            auto cwd = sb.as_cwd();
            CHECK(cwd.previous() == before);
            CHECK(fs::equivalent(fs::current_path(), sb.path()));
            write_file("relative.txt", "Written relative to the sandbox");
        }
        CHECK(fs::current_path() == before);
        CHECK(fs::exists(sb.path() / "relative.txt"));
        CHECK(sb.is_open());
    }

    SECTION("With automatic closing") {
        fs::path root;
        auto     n = with_sandbox(sandbox_dir::create({.policy     = deletion_policy::pass_through,
                                                       .parent_dir = scratch.path()}),
                              [&](sandbox_dir& sb) {
                                  root = sb.path();
                                  CHECK(fs::equivalent(fs::current_path(), sb.path()));
                                  return 42;
                              });
        CHECK(n == 42);
        CHECK(fs::current_path() == before);
        CHECK_FALSE(fs::exists(root));
    }

    SECTION("Restoring the directory when the body throws") {
        fs::path root;
        CHECK_THROWS_AS(with_sandbox(sandbox_dir::create({.policy = deletion_policy::pass_through,
                                                          .parent_dir = scratch.path()}),
                                     [&](sandbox_dir& sb) {
                                         root = sb.path();
                                         throw std::runtime_error("Oops");
                                     }),
                        std::runtime_error);
        CHECK(fs::current_path() == before);
        CHECK_FALSE(fs::exists(root));
    }
}
