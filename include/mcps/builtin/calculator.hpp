#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcps::builtin {

// ─────────────────────────────────────────────────────────────────────────────
// Arithmetic expression evaluator
// ─────────────────────────────────────────────────────────────────────────────
// Grammar (lowest to highest precedence):
//
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/' | '%') unary)*
//   unary   := ('+' | '-') unary | power
//   power   := primary (('^' | '**') unary)?          right-associative
//   primary := number | constant | function '(' args ')' | '(' expr ')'
//
// Constants: pi, e. Functions: sqrt sin cos tan asin acos atan log log10
// exp abs floor ceil round (one argument), pow (two), min max (one or more).
// Input is only ever parsed, never executed.

struct CalcError {
    std::string message;
    std::size_t position{0};  // offset into the expression
};

using CalcResult = tl::expected<double, CalcError>;

/// Evaluate `expression`. Division by zero and non-finite results are errors.
[[nodiscard]] CalcResult evaluate(std::string_view expression);

/// Integral values print without a fractional part; others with up to 15
/// significant digits.
[[nodiscard]] std::string format_number(double value);

}  // namespace mcps::builtin
