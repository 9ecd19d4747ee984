#pragma once

#include <tmpdir/temp.hpp>
#include <tmpdir/util/fs/path.hpp>

#include <boost/leaf.hpp>
#include <catch2/catch.hpp>

#include <exception>
#include <vector>

namespace tmpdir::testing {

template <typename Fn>
constexpr auto leaf_handle_nofail(Fn&& fn) {
    using rtype = decltype(fn());
    if constexpr (boost::leaf::is_result_type<rtype>::value) {
        return boost::leaf::try_handle_all(  //
            fn,
            [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn().value()) {
                FAIL("Operation failed: " << info);
                std::terminate();
            });
    } else {
        return boost::leaf::try_catch(  //
            fn,
            [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn()) {
                FAIL("Operation failed: " << info);
                std::terminate();
            });
    }
}
#define REQUIRES_LEAF_NOFAIL(...)                                                                  \
    (::tmpdir::testing::leaf_handle_nofail([&] { return (__VA_ARGS__); }))

/// List the names directly within a directory
inline std::vector<fs::path> list_dir(path_ref dir) {
    std::vector<fs::path> ret;
    for (auto& entry : fs::directory_iterator{dir}) {
        ret.push_back(entry.path().filename());
    }
    return ret;
}

}  // namespace tmpdir::testing
