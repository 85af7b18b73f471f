#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcps/builtin/calculator.hpp"

#include <cmath>
#include <numbers>
#include <string>

using namespace mcps::builtin;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinRel;

namespace {

double eval_ok(std::string_view expression) {
    auto result = evaluate(expression);
    INFO(expression);
    REQUIRE(result.has_value());
    return *result;
}

std::string eval_error(std::string_view expression) {
    auto result = evaluate(expression);
    INFO(expression);
    REQUIRE_FALSE(result.has_value());
    return result.error().message;
}

}  // namespace

TEST_CASE("Arithmetic follows operator precedence", "[calculator]") {
    REQUIRE(eval_ok("2 + 3 * 4") == 14.0);
    REQUIRE(eval_ok("(2 + 3) * 4") == 20.0);
    REQUIRE(eval_ok("10 - 4 - 3") == 3.0);
    REQUIRE(eval_ok("100 / 10 / 5") == 2.0);
    REQUIRE(eval_ok("7 % 4") == 3.0);
    REQUIRE(eval_ok("  1+1  ") == 2.0);
}

TEST_CASE("Exponentiation is right associative and binds tighter than unary minus", "[calculator]") {
    REQUIRE(eval_ok("2 ^ 3 ^ 2") == 512.0);
    REQUIRE(eval_ok("2 ** 10") == 1024.0);
    REQUIRE(eval_ok("-2 ^ 2") == -4.0);
    REQUIRE(eval_ok("2 ^ -1") == 0.5);
    REQUIRE(eval_ok("3 * 2 ** 2") == 12.0);
}

TEST_CASE("Numbers, constants and unary signs", "[calculator]") {
    REQUIRE(eval_ok(".5 + 1.25") == 1.75);
    REQUIRE(eval_ok("1e3") == 1000.0);
    REQUIRE(eval_ok("--3") == 3.0);
    REQUIRE(eval_ok("+4") == 4.0);
    REQUIRE(eval_ok("pi") == std::numbers::pi);
    REQUIRE(eval_ok("e") == std::numbers::e);
}

TEST_CASE("Functions", "[calculator]") {
    REQUIRE(eval_ok("sqrt(16)") == 4.0);
    REQUIRE_THAT(eval_ok("sin(pi / 2)"), WithinRel(1.0, 1e-12));
    REQUIRE_THAT(eval_ok("log(e)"), WithinRel(1.0, 1e-12));
    REQUIRE_THAT(eval_ok("log10(1000)"), WithinRel(3.0, 1e-12));
    REQUIRE(eval_ok("abs(-7.5)") == 7.5);
    REQUIRE(eval_ok("floor(2.7) + ceil(2.2) + round(2.5)") == 8.0);
    REQUIRE(eval_ok("pow(2, 8)") == 256.0);
    REQUIRE(eval_ok("min(4, 2, 9)") == 2.0);
    REQUIRE(eval_ok("max(4, 2 * 6, 9)") == 12.0);
    REQUIRE(eval_ok("sqrt(pow(3, 2) + pow(4, 2))") == 5.0);
}

TEST_CASE("Evaluation errors", "[calculator]") {
    REQUIRE_THAT(eval_error("1 / 0"), ContainsSubstring("division by zero"));
    REQUIRE_THAT(eval_error("5 % 0"), ContainsSubstring("modulo by zero"));
    REQUIRE_THAT(eval_error("foo + 1"), ContainsSubstring("unknown identifier 'foo'"));
    REQUIRE_THAT(eval_error("bar(1)"), ContainsSubstring("unknown function 'bar'"));
    REQUIRE_THAT(eval_error("sqrt(1, 2)"), ContainsSubstring("sqrt() takes 1 argument(s), got 2"));
    REQUIRE_THAT(eval_error("pow(2)"), ContainsSubstring("takes 2"));
    REQUIRE_THAT(eval_error("min()"), ContainsSubstring("at least 1"));
    REQUIRE_THAT(eval_error("sqrt(-1)"), ContainsSubstring("not a finite number"));
    REQUIRE_THAT(eval_error("10 ^ 400"), ContainsSubstring("not a finite number"));
}

TEST_CASE("Syntax errors report a position", "[calculator]") {
    auto result = evaluate("2 + * 3");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().position == 4);
    REQUIRE_THAT(result.error().message, ContainsSubstring("at position 4"));

    REQUIRE_THAT(eval_error(""), ContainsSubstring("unexpected end of expression"));
    REQUIRE_THAT(eval_error("(1 + 2"), ContainsSubstring("expected ')'"));
    REQUIRE_THAT(eval_error("1 + 2)"), ContainsSubstring("unexpected ')'"));
    REQUIRE_THAT(eval_error("3 $ 4"), ContainsSubstring("unexpected '$'"));
    REQUIRE_THAT(eval_error("max(1 2)"), ContainsSubstring("expected ',' or ')'"));
}

TEST_CASE("Deep nesting is refused", "[calculator]") {
    const std::string deep = std::string(200, '(') + "1" + std::string(200, ')');
    REQUIRE_THAT(eval_error(deep), ContainsSubstring("nested too deeply"));

    const std::string negations = std::string(200, '-') + "1";
    REQUIRE_THAT(eval_error(negations), ContainsSubstring("nested too deeply"));

    const std::string shallow = std::string(10, '(') + "1" + std::string(10, ')');
    REQUIRE(eval_ok(shallow) == 1.0);
}

TEST_CASE("format_number", "[calculator]") {
    REQUIRE(format_number(14.0) == "14");
    REQUIRE(format_number(-3.0) == "-3");
    REQUIRE(format_number(-0.0) == "0");
    REQUIRE(format_number(0.5) == "0.5");
    REQUIRE(format_number(1.0 / 3.0) == "0.333333333333333");
    REQUIRE(format_number(1e20) == "1e+20");
    REQUIRE(format_number(123456789012.0) == "123456789012");
}
