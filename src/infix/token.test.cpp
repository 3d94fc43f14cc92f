#include <infix/applicator.hpp>
#include <infix/token.hpp>

#include <neo/test_concept.hpp>

#include <catch2/catch.hpp>

#include <type_traits>

#include <unistd.h>

NEO_TEST_CONCEPT(infix::operator_token<infix::pipe_t>);
NEO_TEST_CONCEPT(infix::operator_token<infix::star_t>);
NEO_TEST_CONCEPT(infix::operator_token<infix::percent_t>);
NEO_TEST_CONCEPT(infix::operator_token<infix::caret_t>);
NEO_TEST_CONCEPT(!infix::operator_token<int>);

struct not_a_token {};
NEO_TEST_CONCEPT(!infix::operator_token<not_a_token>);

TEST_CASE("Token spellings") {
    CHECK(infix::spelling_of<infix::pipe_t> == "|");
    CHECK(infix::spelling_of<infix::star_t> == "*");
    CHECK(infix::spelling_of<infix::percent_t> == "%");
    CHECK(infix::spelling_of<infix::caret_t> == "^");
}

TEST_CASE("Token objects coexist with POSIX names under a using-directive") {
    using namespace infix;
    int fds[2] = {-1, -1};
    static_assert(std::is_same_v<decltype(pipe(fds)), int>);

    auto times = make_applicator(star_token, [](int a, int b) { return a * b; });
    CHECK((2 * times * 3) == 6);
    auto plus = make_applicator(pipe_token, [](int a, int b) { return a + b; });
    CHECK((2 | plus | 3) == 5);
}
