#include "./random_name.hpp"

#include <tmpdir/error/result.hpp>
#include <tmpdir/util/log.hpp>

using namespace tmpdir;

namespace {

constexpr int max_name_attempts = 64;

}  // namespace

name_generator::name_generator() {
    std::random_device rd;
    std::seed_seq      seq{rd(), rd(), rd(), rd()};
    _engine.seed(seq);
}

std::string name_generator::next(std::size_t length) {
    std::uniform_int_distribution<std::size_t> dist{0, random_name_alphabet.size() - 1};
    std::string                                 ret;
    ret.reserve(length);
    while (ret.size() < length) {
        ret.push_back(random_name_alphabet[dist(_engine)]);
    }
    return ret;
}

result<fs::path>
tmpdir::unused_sibling_name(name_generator& gen, path_ref dir, std::string_view suffix) noexcept {
    for (int attempt = 0; attempt < max_name_attempts; ++attempt) {
        auto            candidate = dir / (gen.next() + std::string(suffix));
        std::error_code ec;
        auto            st = fs::symlink_status(candidate, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return new_error(ec, e_resolve_path{candidate});
        }
        if (!fs::exists(st)) {
            return candidate;
        }
        tmpdir_log(trace, "Random name [{}] is already taken. Drawing another.", candidate.string());
    }
    return new_error(std::make_error_code(std::errc::file_exists),
                     e_name_attempts{max_name_attempts},
                     e_resolve_path{dir});
}
