#pragma once

namespace boost::leaf {

class bad_result;

template <typename T>
class result;

}  // namespace boost::leaf

namespace tmpdir {

using boost::leaf::bad_result;
using boost::leaf::result;

}  // namespace tmpdir
