#include "./proc.hpp"

#include <tmpdir/temp.hpp>

#include <catch2/catch.hpp>

using namespace tmpdir;

TEST_CASE("Quote command arguments") {
    CHECK(quote_argument("plain") == "plain");
    CHECK(quote_argument("/usr/bin/srm") == "/usr/bin/srm");
    CHECK(quote_argument("has space") == "\"has space\"");
    CHECK(quote_argument("say \"hi\"") == "\"say \\\"hi\\\"\"");
    CHECK(quote_command(std::vector<std::string>{"srm", "-rfs", "--", "/tmp/a b"})
          == "srm -rfs -- \"/tmp/a b\"");
}

TEST_CASE("Run a subprocess") {
    auto res = run_proc({"sh", "-c", "echo out; echo err 1>&2"});
    CHECK(res.okay());
    CHECK(res.output.find("out") != std::string::npos);
    CHECK(res.output.find("err") != std::string::npos);

    auto failed = run_proc({"sh", "-c", "exit 4"});
    CHECK_FALSE(failed.okay());
    CHECK(failed.retc == 4);
    CHECK(failed.signal == 0);

    auto killed = run_proc({"sh", "-c", "kill -9 $$"});
    CHECK_FALSE(killed.okay());
    CHECK(killed.signal == 9);
}

TEST_CASE("Run a subprocess in another directory") {
    auto tdir = temporary_dir::create();
    auto res  = run_proc(proc_options{.command = {"pwd"}, .cwd = tdir.path()});
    REQUIRE(res.okay());
    CHECK(fs::equivalent(res.output.substr(0, res.output.find('\n')), tdir.path()));
}

TEST_CASE("Find programs") {
    auto sh = find_program("sh");
    REQUIRE(sh);
    CHECK(sh->filename() == "sh");
    CHECK(find_program(sh->string()) == sh);
    CHECK_FALSE(find_program("no-such-program-anywhere"));
    CHECK_FALSE(find_program("/no/such/program"));
    CHECK_FALSE(find_program(""));
}
