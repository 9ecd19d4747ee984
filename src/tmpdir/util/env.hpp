#pragma once

#include <optional>
#include <string_view>
#include <string>

namespace tmpdir {

std::optional<std::string> getenv(const std::string& env) noexcept;

/**
 * @brief Obtain the value of an environment variable, or the given default if it is unset or empty
 */
std::string getenv(const std::string& name, std::string_view default_) noexcept;

}  // namespace tmpdir
