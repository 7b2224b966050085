#include "./extract.hpp"

#include "./errors.hpp"

#include <incpath/error/errors.hpp>
#include <incpath/error/try_catch.hpp>
#include <incpath/incpath.test.hpp>

#include <catch2/catch.hpp>

using strings = std::vector<std::string>;

namespace {

const std::string_view GCC_OUTPUT = R"(Using built-in specs.
COLLECT_GCC=g++
Target: x86_64-linux-gnu
Thread model: posix
gcc version 12.2.0 (Debian 12.2.0-14)
 /usr/lib/gcc/x86_64-linux-gnu/12/cc1plus -E -quiet -v -imultiarch x86_64-linux-gnu -D_GNU_SOURCE - -mtune=generic -march=x86-64
ignoring nonexistent directory "/usr/local/include/x86_64-linux-gnu"
ignoring nonexistent directory "/usr/lib/gcc/x86_64-linux-gnu/12/include-fixed"
#include "..." search starts here:
#include <...> search starts here:
 /usr/include/c++/12
 /usr/include/x86_64-linux-gnu/c++/12
 /usr/include/c++/12/backward
 /usr/lib/gcc/x86_64-linux-gnu/12/include
 /usr/local/include
 /usr/include/x86_64-linux-gnu
 /usr/include
End of search list.
# 0 "<stdin>"
# 0 "<built-in>"
)";

const std::string_view APPLE_CLANG_OUTPUT = R"(Apple clang version 15.0.0 (clang-1500.1.0.2.5)
Target: arm64-apple-darwin23.2.0
#include "..." search starts here:
#include <...> search starts here:
 /Library/Developer/CommandLineTools/usr/lib/clang/15.0.0/include
 /Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/usr/include
 /Library/Developer/CommandLineTools/usr/include
 /Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/System/Library/Frameworks (framework directory)
End of search list.
)";

}  // namespace

TEST_CASE("Extract the search list from GCC output") {
    auto dirs = REQUIRES_LEAF_NOFAIL(incpath::extract_search_dirs(GCC_OUTPUT));
    CHECK(dirs
          == strings{
              "/usr/include/c++/12",
              "/usr/include/x86_64-linux-gnu/c++/12",
              "/usr/include/c++/12/backward",
              "/usr/lib/gcc/x86_64-linux-gnu/12/include",
              "/usr/local/include",
              "/usr/include/x86_64-linux-gnu",
              "/usr/include",
          });
}

TEST_CASE("Extract the search list from Apple Clang output") {
    auto dirs = REQUIRES_LEAF_NOFAIL(incpath::extract_search_dirs(APPLE_CLANG_OUTPUT));
    REQUIRE(dirs.size() == 4);
    CHECK(dirs[0] == "/Library/Developer/CommandLineTools/usr/lib/clang/15.0.0/include");
    CHECK(dirs[3]
          == "/Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/System/Library/Frameworks "
             "(framework directory)");
}

TEST_CASE("Blank lines and surrounding whitespace are dropped") {
    auto dirs = REQUIRES_LEAF_NOFAIL(incpath::extract_search_dirs(
        "#include <...> search starts here:\r\n"
        "   /first  \r\n"
        "\r\n"
        "\t\t\n"
        " /second\n"
        "    \n"
        " /third\n"
        "End of search list.\n"));
    CHECK(dirs == strings{"/first", "/second", "/third"});
}

TEST_CASE("An empty search list is not an error") {
    auto dirs = REQUIRES_LEAF_NOFAIL(
        incpath::extract_search_dirs("#include <...> search starts here:\nEnd of search list.\n"));
    CHECK(dirs.empty());
}

TEST_CASE("Custom markers") {
    incpath::search_list_markers markers{.start = "BEGIN", .end = "END"};
    auto                         dirs = REQUIRES_LEAF_NOFAIL(
        incpath::extract_search_dirs("noise\nBEGIN\n /a\n /b\nEND\n /not-me\n", markers));
    CHECK(dirs == strings{"/a", "/b"});
}

TEST_CASE("A missing end marker is an error") {
    std::string_view output = "#include <...> search starts here:\n /usr/include\n";
    incpath_leaf_try {
        (void)incpath::extract_search_dirs(output);
        FAIL_CHECK("Expected an error");
    }
    incpath_leaf_catch(incpath::e_delimiter_not_found missing, incpath::e_probe_output raw) {
        CHECK(missing.value == "End of search list.");
        CHECK(raw.value == output);
    }
    incpath_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("A missing start marker is an error") {
    std::string_view output = "gcc: fatal error: no input files\nEnd of search list.\n";
    incpath_leaf_try {
        (void)incpath::extract_search_dirs(output);
        FAIL_CHECK("Expected an error");
    }
    incpath_leaf_catch(incpath::e_delimiter_not_found missing, incpath::e_probe_output raw) {
        CHECK(missing.value == "#include <...> search starts here:");
        CHECK(raw.value == output);
    }
    incpath_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("An end marker before the start marker does not count") {
    std::string_view output = "End of search list.\n#include <...> search starts here:\n /a\n";
    incpath_leaf_try {
        (void)incpath::extract_search_dirs(output);
        FAIL_CHECK("Expected an error");
    }
    incpath_leaf_catch(incpath::e_delimiter_not_found missing) {
        CHECK(missing.value == "End of search list.");
    }
    incpath_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}
