#include "./config.hpp"

#include <tmpdir/util/env.hpp>

std::string tmpdir::config::defaults::wipe_program() {
    return tmpdir::getenv("TMPDIR_WIPE_PROGRAM", "srm");
}

std::optional<std::string> tmpdir::config::defaults::log_level_name() {
    return tmpdir::getenv("TMPDIR_LOG_LEVEL");
}
