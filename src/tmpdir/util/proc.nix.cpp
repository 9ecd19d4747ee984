#ifndef _WIN32
#include "./proc.hpp"

#include <tmpdir/util/env.hpp>
#include <tmpdir/util/log.hpp>

#include <fmt/core.h>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>

using namespace tmpdir;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

::pid_t spawn_child(const proc_options& opts, int stdout_pipe, int close_me) {
    // We must allocate BEFORE fork(), since the CRT might stumble with malloc()-related locks that
    // are held during the fork().
    std::vector<const char*> strings;
    strings.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        strings.push_back(s.data());
    }
    strings.push_back(nullptr);

    std::string workdir = opts.cwd.value_or(std::filesystem::current_path()).string();
    auto        not_found_err
        = fmt::format("[tmpdir child executor] The requested executable [{}] could not be found.\n",
                      strings[0]);

    auto child_pid = ::fork();
    check_rc(child_pid != -1, "Failed to fork() a subprocess");
    if (child_pid != 0) {
        return child_pid;
    }
    // We are child
    ::close(close_me);
    if (::dup2(stdout_pipe, STDOUT_FILENO) == -1 || ::dup2(stdout_pipe, STDERR_FILENO) == -1
        || ::chdir(workdir.data()) == -1) {
        std::fputs("[tmpdir child executor] Failed to prepare the child process: ", stderr);
        std::fputs(std::strerror(errno), stderr);
        std::_Exit(-1);
    }

    ::execvp(strings[0], (char* const*)strings.data());

    if (errno == ENOENT) {
        std::fputs(not_found_err.c_str(), stderr);
        std::_Exit(-1);
    }

    std::fputs("[tmpdir child executor] execvp returned! This is a fatal error: ", stderr);
    std::fputs(std::strerror(errno), stderr);
    std::fputs("\n", stderr);
    std::_Exit(-1);
}

}  // namespace

proc_result tmpdir::run_proc(const proc_options& opts) {
    tmpdir_log(debug, "Spawning subprocess: {}", quote_command(opts.command));
    int  stdio_pipe[2] = {};
    auto rc            = ::pipe(stdio_pipe);
    check_rc(rc == 0, "Create stdio pipe for subprocess");

    int read_pipe  = stdio_pipe[0];
    int write_pipe = stdio_pipe[1];

    auto child = spawn_child(opts, write_pipe, read_pipe);
    ::close(write_pipe);

    pollfd stdio_fd;
    stdio_fd.fd     = read_pipe;
    stdio_fd.events = POLLIN;

    proc_result res;
    while (true) {
        rc = ::poll(&stdio_fd, 1, -1);
        if (rc == -1 && errno == EINTR) {
            errno = 0;
            continue;
        }
        std::string buffer;
        buffer.resize(1024);
        auto nread = ::read(stdio_fd.fd, buffer.data(), buffer.size());
        if (nread == 0) {
            break;
        }
        if (nread < 0 && errno == EINTR) {
            continue;
        }
        check_rc(nread > 0, "Failed in read()");
        res.output.append(buffer.begin(), buffer.begin() + nread);
    }
    ::close(read_pipe);

    int status = 0;
    do {
        rc = ::waitpid(child, &status, 0);
    } while (rc == -1 && errno == EINTR);
    check_rc(rc >= 0, "Failed in waitpid()");

    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }
    return res;
}

std::optional<std::filesystem::path> tmpdir::find_program(std::string_view name) noexcept {
    namespace fs = std::filesystem;
    auto is_executable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != name.npos) {
        fs::path candidate{name};
        if (is_executable(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    auto path_env = tmpdir::getenv("PATH", "/usr/local/bin:/usr/bin:/bin");
    std::string_view remaining = path_env;
    while (true) {
        auto             colon = remaining.find(':');
        std::string_view dir   = remaining.substr(0, colon);
        // An empty element means the current directory
        auto candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
        if (colon == remaining.npos) {
            break;
        }
        remaining.remove_prefix(colon + 1);
    }
    return std::nullopt;
}

#endif  // _WIN32
