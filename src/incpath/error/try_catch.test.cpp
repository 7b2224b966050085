#include "./try_catch.hpp"

#include <boost/leaf/exception.hpp>
#include <catch2/catch.hpp>

namespace {

struct e_some_context {
    int value;
};

}  // namespace

TEST_CASE("Try-catch") {
    auto r = incpath_leaf_try { return 2; }
    incpath_leaf_catch_all->int { return 0; };
    CHECK(r == 2);
}

TEST_CASE("Try-catch with a thrown error object") {
    auto r = incpath_leaf_try->int {
        BOOST_LEAF_THROW_EXCEPTION(e_some_context{42});
    }
    incpath_leaf_catch(e_some_context ctx)->int { return ctx.value; }
    incpath_leaf_catch_all->int { return -1; };
    CHECK(r == 42);
}
