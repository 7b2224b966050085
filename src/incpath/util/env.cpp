#include "./env.hpp"

#include <incpath/util/log.hpp>
#include <incpath/util/string.hpp>

#include <cstdlib>

std::optional<std::string> incpath::getenv(std::string_view name) {
    // std::getenv needs a terminated string, and a view may not have one
    const std::string key{name};
    if (auto cptr = std::getenv(key.c_str())) {
        return std::string(cptr);
    }
    return std::nullopt;
}

std::optional<std::string> incpath::getenv_setting(std::string_view name) {
    auto raw = getenv(name);
    if (!raw) {
        return std::nullopt;
    }
    auto value = trim_view(*raw);
    if (value.empty()) {
        incpath_log(trace, "${} is set but blank, treating it as unset", name);
        return std::nullopt;
    }
    return std::string(value);
}
