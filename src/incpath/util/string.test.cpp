#include "./string.hpp"

#include <catch2/catch.hpp>

using namespace incpath;

TEST_CASE("Trim") {
    CHECK(trim_view("  /usr/include  ") == "/usr/include");
    CHECK(trim_view("\t/usr/include\r") == "/usr/include");
    CHECK(trim_view("    ") == "");
    CHECK(trim_view("") == "");
    CHECK(trim_view("x") == "x");
}

TEST_CASE("Split") {
    CHECK(split("/a:/b", ":") == std::vector<std::string>{"/a", "/b"});
    CHECK(split("/a::/b", ":") == std::vector<std::string>{"/a", "", "/b"});
    CHECK(split("", ":") == std::vector<std::string>{""});
    CHECK(split(":", ":") == std::vector<std::string>{"", ""});
}

TEST_CASE("Split lines") {
    CHECK(split_lines("a\nb\n") == std::vector<std::string_view>{"a", "b"});
    CHECK(split_lines("a\r\nb") == std::vector<std::string_view>{"a", "b"});
    CHECK(split_lines("a\n\nb") == std::vector<std::string_view>{"a", "", "b"});
    CHECK(split_lines("").empty());
}

TEST_CASE("Replace") {
    CHECK(replace("foo bar foo", "foo", "baz") == "baz bar baz");
    CHECK(replace("a\\b", "\\", "\\\\") == "a\\\\b");
    CHECK(replace("nothing", "x", "y") == "nothing");
}
