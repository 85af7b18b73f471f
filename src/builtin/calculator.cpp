#include "mcps/builtin/calculator.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <numbers>
#include <vector>

namespace mcps::builtin {

namespace {

constexpr std::size_t kMaxDepth = 64;

class Parser {
public:
    explicit Parser(std::string_view input) : input_(input) {}

    CalcResult parse() {
        auto value = parse_expr();
        if (!value) {
            return value;
        }
        skip_space();
        if (pos_ != input_.size()) {
            return fail("unexpected '" + std::string(1, input_[pos_]) + "'");
        }
        if (std::isfinite(*value) == false) {
            return tl::unexpected(CalcError{"result is not a finite number", 0});
        }
        return value;
    }

private:
    std::string_view input_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    tl::unexpected<CalcError> fail(std::string message) const {
        return tl::unexpected(CalcError{std::move(message) + " at position " + std::to_string(pos_), pos_});
    }

    void skip_space() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            ++pos_;
        }
    }

    bool accept(char c) {
        skip_space();
        if (pos_ < input_.size() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool accept_power() {
        skip_space();
        if (input_.substr(pos_, 2) == "**") {
            pos_ += 2;
            return true;
        }
        return accept('^');
    }

    CalcResult parse_expr() {
        if (++depth_ > kMaxDepth) {
            return fail("expression nested too deeply");
        }
        auto lhs = parse_term();
        while (lhs) {
            if (accept('+')) {
                auto rhs = parse_term();
                if (!rhs) return rhs;
                *lhs += *rhs;
            } else if (accept('-')) {
                auto rhs = parse_term();
                if (!rhs) return rhs;
                *lhs -= *rhs;
            } else {
                break;
            }
        }
        --depth_;
        return lhs;
    }

    CalcResult parse_term() {
        auto lhs = parse_unary();
        while (lhs) {
            skip_space();
            // '**' belongs to parse_power
            if (input_.substr(pos_, 2) == "**") {
                break;
            }
            if (accept('*')) {
                auto rhs = parse_unary();
                if (!rhs) return rhs;
                *lhs *= *rhs;
            } else if (accept('/')) {
                auto rhs = parse_unary();
                if (!rhs) return rhs;
                if (*rhs == 0.0) {
                    return fail("division by zero");
                }
                *lhs /= *rhs;
            } else if (accept('%')) {
                auto rhs = parse_unary();
                if (!rhs) return rhs;
                if (*rhs == 0.0) {
                    return fail("modulo by zero");
                }
                *lhs = std::fmod(*lhs, *rhs);
            } else {
                break;
            }
        }
        return lhs;
    }

    CalcResult parse_unary() {
        if (++depth_ > kMaxDepth) {
            return fail("expression nested too deeply");
        }
        CalcResult result;
        if (accept('-')) {
            result = parse_unary();
            if (result) {
                *result = -*result;
            }
        } else if (accept('+')) {
            result = parse_unary();
        } else {
            result = parse_power();
        }
        --depth_;
        return result;
    }

    CalcResult parse_power() {
        auto base = parse_primary();
        if (!base) {
            return base;
        }
        if (accept_power()) {
            auto exponent = parse_unary();
            if (!exponent) {
                return exponent;
            }
            return std::pow(*base, *exponent);
        }
        return base;
    }

    CalcResult parse_primary() {
        skip_space();
        if (pos_ >= input_.size()) {
            return fail("unexpected end of expression");
        }

        const char c = input_[pos_];
        if (c == '(') {
            ++pos_;
            auto inner = parse_expr();
            if (!inner) {
                return inner;
            }
            if (accept(')') == false) {
                return fail("expected ')'");
            }
            return inner;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            return parse_number();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            return parse_identifier();
        }
        return fail("unexpected '" + std::string(1, c) + "'");
    }

    CalcResult parse_number() {
        // strtod needs a terminated buffer
        const std::string rest(input_.substr(pos_));
        char* end = nullptr;
        const double value = std::strtod(rest.c_str(), &end);
        const auto consumed = static_cast<std::size_t>(end - rest.c_str());
        if (consumed == 0) {
            return fail("malformed number");
        }
        pos_ += consumed;
        return value;
    }

    CalcResult parse_identifier() {
        const std::size_t start = pos_;
        while (pos_ < input_.size()
               && (std::isalnum(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '_')) {
            ++pos_;
        }
        const std::string name(input_.substr(start, pos_ - start));

        if (accept('(') == false) {
            if (name == "pi") return std::numbers::pi;
            if (name == "e") return std::numbers::e;
            return tl::unexpected(CalcError{"unknown identifier '" + name + "'", start});
        }

        std::vector<double> args;
        if (accept(')') == false) {
            while (true) {
                auto arg = parse_expr();
                if (!arg) {
                    return arg;
                }
                args.push_back(*arg);
                if (accept(',')) {
                    continue;
                }
                if (accept(')')) {
                    break;
                }
                return fail("expected ',' or ')'");
            }
        }
        return apply(name, args, start);
    }

    static CalcResult apply(const std::string& name, const std::vector<double>& args, std::size_t at) {
        auto arity_error = [&](const char* expected) {
            return tl::unexpected(CalcError{
                name + "() takes " + expected + " argument(s), got " + std::to_string(args.size()), at});
        };

        using Unary = double (*)(double);
        static const std::pair<const char*, Unary> unary[] = {
            {"sqrt", [](double x) { return std::sqrt(x); }},
            {"sin", [](double x) { return std::sin(x); }},
            {"cos", [](double x) { return std::cos(x); }},
            {"tan", [](double x) { return std::tan(x); }},
            {"asin", [](double x) { return std::asin(x); }},
            {"acos", [](double x) { return std::acos(x); }},
            {"atan", [](double x) { return std::atan(x); }},
            {"log", [](double x) { return std::log(x); }},
            {"log10", [](double x) { return std::log10(x); }},
            {"exp", [](double x) { return std::exp(x); }},
            {"abs", [](double x) { return std::fabs(x); }},
            {"floor", [](double x) { return std::floor(x); }},
            {"ceil", [](double x) { return std::ceil(x); }},
            {"round", [](double x) { return std::round(x); }},
        };
        for (const auto& [fn_name, fn] : unary) {
            if (name == fn_name) {
                if (args.size() != 1) {
                    return arity_error("1");
                }
                return fn(args[0]);
            }
        }

        if (name == "pow") {
            if (args.size() != 2) {
                return arity_error("2");
            }
            return std::pow(args[0], args[1]);
        }
        if (name == "min" || name == "max") {
            if (args.empty()) {
                return arity_error("at least 1");
            }
            double best = args[0];
            for (const double v : args) {
                best = (name == "min") ? std::fmin(best, v) : std::fmax(best, v);
            }
            return best;
        }
        return tl::unexpected(CalcError{"unknown function '" + name + "'", at});
    }
};

}  // namespace

CalcResult evaluate(std::string_view expression) {
    return Parser(expression).parse();
}

std::string format_number(double value) {
    if (value == 0.0) {
        return "0";  // also folds -0
    }
    if (std::fabs(value) < 1e15 && std::floor(value) == value) {
        return std::to_string(static_cast<long long>(value));
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
    return buffer;
}

}  // namespace mcps::builtin
