#include <infix/compose.hpp>

#include <neo/test_concept.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <cctype>
#include <concepts>
#include <string>
#include <string_view>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string strip(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return std::string(s);
}

constexpr auto square = [](int x) { return x * x; };
constexpr auto inc    = [](int x) { return x + 1; };

}  // namespace

NEO_TEST_CONCEPT(std::invocable<decltype(infix::compose(square, inc)), int>);
NEO_TEST_CONCEPT(!std::invocable<decltype(infix::compose(square, inc)), std::string>);
NEO_TEST_CONCEPT(!std::invocable<decltype(infix::compose(strip, inc)), int>);

TEST_CASE("Compose two functions") {
    auto f = infix::compose(square, inc);
    CHECK(f(3) == 16);
    CHECK(infix::compose(inc, square)(3) == 10);
}

TEST_CASE("Compose functions with the infix composer") {
    auto pipeline = strip | infix::composer | lower;
    CHECK(pipeline("  HI ") == "hi");
    CHECK(pipeline("\tMiXeD case\n") == "mixed case");

    auto x = GENERATE(-4, 0, 1, 12);
    CHECK((square | infix::composer | inc)(x) == square(inc(x)));
    CHECK((inc | infix::composer | square)(x) == inc(square(x)));
}

TEST_CASE("Composition chains apply right to left") {
    // inc(square(inc(x)))
    auto chain = inc | infix::composer | square | infix::composer | inc;
    CHECK(chain(2) == 10);
    CHECK(chain(-1) == 1);
}

TEST_CASE("Composition is usable at compile time") {
    constexpr auto f = square | infix::composer | inc;
    static_assert(f(4) == 25);
    static_assert(f.outer()(2) == 4);
    static_assert(f.inner()(2) == 3);
}
