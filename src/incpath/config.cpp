#include "./config.hpp"

#include <incpath/util/env.hpp>

#include <charconv>

using namespace std::chrono_literals;

std::chrono::milliseconds incpath::config::defaults::probe_timeout() {
    constexpr auto dflt = 30'000ms;
    auto           str  = incpath::getenv_setting("INCPATH_PROBE_TIMEOUT_MS");
    if (!str) {
        return dflt;
    }
    long long count = 0;
    auto [ptr, ec]  = std::from_chars(str->data(), str->data() + str->size(), count);
    if (ec != std::errc{} || ptr != str->data() + str->size() || count <= 0) {
        incpath_log(warn,
                    "Ignoring invalid INCPATH_PROBE_TIMEOUT_MS value '{}' (using {}ms)",
                    *str,
                    dflt.count());
        return dflt;
    }
    return std::chrono::milliseconds(count);
}

std::string incpath::config::defaults::dependency_prefix_var() {
    return incpath::getenv_setting("INCPATH_DEP_PREFIX_VAR", [] { return "INCPATH_DEP_PREFIXES"; });
}

incpath::log::level incpath::config::defaults::log_level() {
    auto str = incpath::getenv_setting("INCPATH_LOG_LEVEL");
    if (!str) {
        return log::level::info;
    }
    const auto& name = *str;
    // clang-format off
    if (name == "trace")    return log::level::trace;
    if (name == "debug")    return log::level::debug;
    if (name == "info")     return log::level::info;
    if (name == "warn")     return log::level::warn;
    if (name == "error")    return log::level::error;
    if (name == "critical") return log::level::critical;
    if (name == "silent")   return log::level::silent;
    // clang-format on
    incpath_log(warn, "Unknown INCPATH_LOG_LEVEL '{}', using 'info'", *str);
    return log::level::info;
}
