#include "./log.hpp"

#include <tmpdir/config.hpp>

#include <magic_enum.hpp>
#include <neo/assert.hpp>

#include <spdlog/spdlog.h>

void tmpdir::log::init_logger() noexcept {
    spdlog::set_pattern("[%^%-5l%$] %v");
    auto name = config::log_level_name();
    if (!name) {
        return;
    }
    auto lvl = magic_enum::enum_cast<level>(*name);
    if (lvl) {
        current_log_level = *lvl;
    } else {
        tmpdir_log(warn, "Ignoring unknown log level name '{}'", *name);
    }
}

void tmpdir::log::log_print(level l, std::string_view msg) noexcept {
    static auto logger_inst = [] {
        auto logger = spdlog::default_logger_raw();
        logger->set_level(spdlog::level::trace);
        return logger;
    }();

    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
    }();

    logger_inst->log(lvl, "{}", msg);
}
