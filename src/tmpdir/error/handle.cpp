#include "./handle.hpp"

#include <tmpdir/util/log.hpp>

#include <boost/leaf.hpp>

#include <sstream>

using namespace tmpdir;

void tmpdir::log_unhandled_error(std::string_view                            message,
                                 const boost::leaf::verbose_diagnostic_info& info) noexcept {
    std::ostringstream strm;
    strm << info;
    tmpdir_log(error, "{}", message);
    tmpdir_log(error, "The error could not be propagated:\n{}", strm.str());
}
