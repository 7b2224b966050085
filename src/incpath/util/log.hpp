#pragma once

#include <fmt/core.h>

#include <string_view>

namespace incpath::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

/**
 * @brief Set the output pattern of the default logger and apply the level from INCPATH_LOG_LEVEL
 */
void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        auto message = fmt::format(fmt::runtime(s), args...);
        log_print(l, message);
    }
}

#define incpath_log(Level, str, ...)                                                               \
    do {                                                                                           \
        if (int(incpath::log::level::Level) >= int(incpath::log::current_log_level)) {             \
            ::incpath::log::log(::incpath::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                                          \
    } while (0)

}  // namespace incpath::log
