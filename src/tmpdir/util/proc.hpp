#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tmpdir {

bool needs_quoting(std::string_view);

std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        acc += quote_argument(arg) + " ";
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

struct proc_result {
    int         signal = 0;
    int         retc   = 0;
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0; }
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<std::filesystem::path> cwd = std::nullopt;
};

/**
 * @brief Run a subprocess to completion, capturing its combined stdout and stderr.
 *
 * Throws std::system_error if the process cannot be spawned or waited on.
 */
proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

/**
 * @brief Search the directories named in $PATH for an executable file with the given name.
 *
 * If the name contains a directory separator, it is checked directly instead.
 */
std::optional<std::filesystem::path> find_program(std::string_view name) noexcept;

}  // namespace tmpdir
