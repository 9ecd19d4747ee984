#include "./proc.hpp"

#include <algorithm>
#include <cctype>

using namespace tmpdir;

namespace {

std::string escape(std::string_view s) {
    std::string ret;
    for (char c : s) {
        if (c == '\\' || c == '"') {
            ret.push_back('\\');
        }
        ret.push_back(c);
    }
    return ret;
}

}  // namespace

bool tmpdir::needs_quoting(std::string_view s) {
    std::string_view okay_chars = "@%-+=:,./|_";
    const bool       all_okay   = std::all_of(s.begin(), s.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || (okay_chars.find(c) != okay_chars.npos);
    });
    return !all_okay;
}

std::string tmpdir::quote_argument(std::string_view s) {
    if (!needs_quoting(s)) {
        return std::string(s);
    }
    return "\"" + escape(s) + "\"";
}
