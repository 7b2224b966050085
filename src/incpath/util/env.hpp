#pragma once

#include <neo/concepts.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace incpath {

/// The raw value of an environment variable, or nullopt if it is not set.
std::optional<std::string> getenv(std::string_view name);

/**
 * @brief Read an environment variable that holds a setting.
 *
 * Surrounding whitespace is removed. A variable that is unset, or set to only whitespace, yields
 * nullopt, so `INCPATH_LOG_LEVEL= ` behaves the same as leaving it unset.
 */
std::optional<std::string> getenv_setting(std::string_view name);

template <neo::invocable Func>
std::string getenv_setting(std::string_view name, Func&& fn) {
    auto val = getenv_setting(name);
    if (!val) {
        return std::string(fn());
    }
    return *val;
}

}  // namespace incpath
