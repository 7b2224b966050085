#include "./log.hpp"

#include <catch2/catch.hpp>

#include <stdlib.h>

TEST_CASE("Logger initialization applies the configured level") {
    ::setenv("INCPATH_LOG_LEVEL", "debug", 1);
    incpath::log::init_logger();
    CHECK(incpath::log::current_log_level == incpath::log::level::debug);
    CHECK(incpath::log::level_enabled(incpath::log::level::info));
    CHECK_FALSE(incpath::log::level_enabled(incpath::log::level::trace));
    incpath_log(debug, "Logging a {} message with {} arguments", "formatted", 2);

    ::unsetenv("INCPATH_LOG_LEVEL");
    incpath::log::init_logger();
    CHECK(incpath::log::current_log_level == incpath::log::level::info);
}
