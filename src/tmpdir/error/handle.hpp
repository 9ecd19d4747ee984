#pragma once

#include <string_view>

namespace boost::leaf {

class verbose_diagnostic_info;

}  // namespace boost::leaf

namespace tmpdir {

/**
 * @brief Log an error that reached a point where it cannot be propagated any further.
 */
void log_unhandled_error(std::string_view message,
                         const boost::leaf::verbose_diagnostic_info&) noexcept;

}  // namespace tmpdir
