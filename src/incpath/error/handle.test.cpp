#include "./handle.hpp"

#include <incpath/error/errors.hpp>
#include <incpath/probe/errors.hpp>
#include <incpath/search/errors.hpp>
#include <incpath/search/extract.hpp>
#include <incpath/util/literal.hpp>

#include <boost/leaf/exception.hpp>
#include <catch2/catch.hpp>

#include <system_error>

TEST_CASE("Successful resolution passes its result through") {
    CHECK(incpath::handle_resolve_errors([] { return 0; }) == 0);
    CHECK(incpath::handle_resolve_errors([] { return 7; }) == 7);
}

TEST_CASE("Resolution failures are reported") {
    CHECK(incpath::handle_resolve_errors([]() -> int {
              BOOST_LEAF_THROW_EXCEPTION(incpath::e_toolchain_probe_failed{.command = {"cc", "-v"},
                                                                           .retc    = 1},
                                         incpath::e_probe_output{"cc: error: oops"},
                                         incpath::e_compiler_path{"cc"});
          })
          == 1);
    CHECK(incpath::handle_resolve_errors([]() -> int {
              (void)incpath::extract_search_dirs("no search list here");
              return 0;
          })
          == 1);
    CHECK(incpath::handle_resolve_errors([]() -> int {
              (void)incpath::unescape_literal("bad\\");
              return 0;
          })
          == 1);
    CHECK(incpath::handle_resolve_errors([]() -> int {
              throw std::system_error(std::make_error_code(std::errc::permission_denied),
                                      "Failed to fork() for subprocess");
          })
          == 1);
    CHECK(incpath::handle_resolve_errors([]() -> int {
              BOOST_LEAF_THROW_EXCEPTION(incpath::e_probe_language{"c"});
          })
          == 1);
}
