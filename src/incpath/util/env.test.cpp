#include "./env.hpp"

#include <catch2/catch.hpp>

#include <stdlib.h>

TEST_CASE("Read environment variables") {
    ::setenv("INCPATH_TEST_ENV_VALUE", " /opt/a:/opt/b ", 1);
    CHECK(incpath::getenv("INCPATH_TEST_ENV_VALUE") == " /opt/a:/opt/b ");

    ::unsetenv("INCPATH_TEST_ENV_VALUE");
    CHECK_FALSE(incpath::getenv("INCPATH_TEST_ENV_VALUE").has_value());

    ::setenv("INCPATH_TEST_ENV_VALUE", "", 1);
    CHECK(incpath::getenv("INCPATH_TEST_ENV_VALUE") == "");
    ::unsetenv("INCPATH_TEST_ENV_VALUE");
}

TEST_CASE("Settings are trimmed and blank ones are unset") {
    ::setenv("INCPATH_TEST_ENV_SETTING", "  debug\n", 1);
    CHECK(incpath::getenv_setting("INCPATH_TEST_ENV_SETTING") == "debug");

    ::setenv("INCPATH_TEST_ENV_SETTING", "   ", 1);
    CHECK_FALSE(incpath::getenv_setting("INCPATH_TEST_ENV_SETTING").has_value());
    CHECK(incpath::getenv_setting("INCPATH_TEST_ENV_SETTING", [] { return "fallback"; })
          == "fallback");

    ::unsetenv("INCPATH_TEST_ENV_SETTING");
    CHECK_FALSE(incpath::getenv_setting("INCPATH_TEST_ENV_SETTING").has_value());
    CHECK(incpath::getenv_setting("INCPATH_TEST_ENV_SETTING", [] { return "fallback"; })
          == "fallback");

    ::setenv("INCPATH_TEST_ENV_SETTING", "MY_PREFIXES", 1);
    CHECK(incpath::getenv_setting("INCPATH_TEST_ENV_SETTING", [] { return "fallback"; })
          == "MY_PREFIXES");
    ::unsetenv("INCPATH_TEST_ENV_SETTING");
}
