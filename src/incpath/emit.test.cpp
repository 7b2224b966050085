#include "./emit.hpp"

#include <incpath/search/normalize.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Render an empty list field") {
    CHECK(incpath::render_list_field("cxx_builtin_include_directories", {})
          == "cxx_builtin_include_directories = []");
}

TEST_CASE("Render a list field") {
    std::vector<incpath::include_directory> dirs = {
        incpath::normalize_include_dir("/usr/include"),
        incpath::normalize_include_dir("/opt/\"vendor\"/include"),
        incpath::normalize_include_dir(R"(C:\sdk\include)"),
    };
    CHECK(incpath::render_list_field("dirs", dirs) == R"(dirs = [
    "/usr/include",
    "/opt/\"vendor\"/include",
    "C:\\sdk\\include",
])");
}
