#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> tmpdir::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr) {
        return std::string(cptr);
    }
    return {};
}

std::string tmpdir::getenv(const std::string& varname, std::string_view default_) noexcept {
    auto val = getenv(varname);
    if (!val || val->empty()) {
        return std::string(default_);
    }
    return *val;
}
