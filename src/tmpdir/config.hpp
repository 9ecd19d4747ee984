#pragma once

#include <optional>
#include <string>

namespace tmpdir::config {

namespace defaults {

/**
 * @brief The name of the external program used for secure deletion. Returns the value of the
 * TMPDIR_WIPE_PROGRAM environment variable, or "srm" if it is not set.
 */
std::string wipe_program();

/**
 * @brief The log level name given by the TMPDIR_LOG_LEVEL environment variable, if set.
 */
std::optional<std::string> log_level_name();

/// The name of the directory created within a new sandbox when none is given
inline constexpr const char* display_name = "tmp";

}  // namespace defaults

using namespace defaults;

}  // namespace tmpdir::config
