#pragma once

#include <tmpdir/error/result_fwd.hpp>
#include <tmpdir/util/fs/path.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace tmpdir {

/// Letters, digits, and underscore
inline constexpr std::string_view random_name_alphabet
    = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_";

inline constexpr std::size_t random_name_length = 8;

/**
 * @brief Generates random file names for anonymizing renames.
 *
 * Names are drawn uniformly from `random_name_alphabet`. Uniqueness is not guaranteed by the
 * generator: use `unused_sibling_name` when a name must not clash with an existing file.
 */
class name_generator {
    std::mt19937_64 _engine;

public:
    name_generator();
    explicit name_generator(std::uint64_t seed)
        : _engine(seed) {}

    [[nodiscard]] std::string next(std::size_t length = random_name_length);
};

struct e_name_attempts {
    int value;
};

/**
 * @brief Choose a path within `dir` that does not yet exist, with a random name ending in `suffix`.
 *
 * Names that collide with an existing entry are discarded and redrawn. If no free name is found
 * after a bounded number of attempts, fails with `std::errc::file_exists`.
 */
[[nodiscard]] result<fs::path>
unused_sibling_name(name_generator& gen, path_ref dir, std::string_view suffix = "") noexcept;

}  // namespace tmpdir
