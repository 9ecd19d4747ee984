#pragma once

#include "./result_fwd.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/result.hpp>

namespace tmpdir {

using boost::leaf::current_error;
using boost::leaf::new_error;

}  // namespace tmpdir
