#include "scheep/builtins.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "scheep/error.hpp"
#include "scheep/printer.hpp"

namespace scheep {
namespace {

[[noreturn]] void arity_error(const std::string& name, const std::string& expected, std::size_t got) {
    throw lisp_error(name + ": expected " + expected + " arguments, got " + std::to_string(got));
}

void require_arity(const std::string& name, const std::vector<value>& args, std::size_t expected) {
    if (args.size() != expected) {
        arity_error(name, std::to_string(expected), args.size());
    }
}

void require_min_arity(const std::string& name, const std::vector<value>& args, std::size_t min_expected) {
    if (args.size() < min_expected) {
        arity_error(name, "at least " + std::to_string(min_expected), args.size());
    }
}

// An operand of arithmetic: exact (int64) or inexact (double). Mixing the two
// gives an inexact result.
struct number {
    bool exact = true;
    std::int64_t whole = 0;
    double real = 0.0;

    [[nodiscard]] double as_double() const { return exact ? static_cast<double>(whole) : real; }
    [[nodiscard]] bool is_zero() const { return exact ? whole == 0 : real == 0.0; }
};

number exact_number(std::int64_t n) {
    return number{true, n, 0.0};
}

number inexact_number(double d) {
    return number{false, 0, d};
}

number to_number(value v, const std::string& op) {
    if (is_integer(v)) {
        return exact_number(integer_value(v));
    }
    if (is_float(v)) {
        return inexact_number(float_value(v));
    }
    throw type_error(op + ": expected number, got " + std::string(type_name(type_of(v))));
}

value to_value(const number& n) {
    return n.exact ? make_integer(n.whole) : make_float(n.real);
}

[[noreturn]] void overflow(const std::string& op) {
    throw lisp_error(op + ": integer overflow");
}

number add(const std::string& op, number lhs, number rhs) {
    if (!lhs.exact || !rhs.exact) {
        return inexact_number(lhs.as_double() + rhs.as_double());
    }
    std::int64_t sum = 0;
    if (__builtin_add_overflow(lhs.whole, rhs.whole, &sum)) {
        overflow(op);
    }
    return exact_number(sum);
}

number subtract(const std::string& op, number lhs, number rhs) {
    if (!lhs.exact || !rhs.exact) {
        return inexact_number(lhs.as_double() - rhs.as_double());
    }
    std::int64_t difference = 0;
    if (__builtin_sub_overflow(lhs.whole, rhs.whole, &difference)) {
        overflow(op);
    }
    return exact_number(difference);
}

number multiply(const std::string& op, number lhs, number rhs) {
    if (!lhs.exact || !rhs.exact) {
        return inexact_number(lhs.as_double() * rhs.as_double());
    }
    std::int64_t product = 0;
    if (__builtin_mul_overflow(lhs.whole, rhs.whole, &product)) {
        overflow(op);
    }
    return exact_number(product);
}

// Exact when the divisor divides evenly, otherwise inexact. Callers have
// already rejected zero divisors.
number divide(const std::string&, number lhs, number rhs) {
    const bool overflows = lhs.whole == std::numeric_limits<std::int64_t>::min() && rhs.whole == -1;
    if (lhs.exact && rhs.exact && !overflows && lhs.whole % rhs.whole == 0) {
        return exact_number(lhs.whole / rhs.whole);
    }
    return inexact_number(lhs.as_double() / rhs.as_double());
}

using number_step = number (*)(const std::string&, number, number);

// Left fold of `step` over the operands. With a single operand the fold
// starts from `unary_seed`, so (- x) is 0 - x and (/ x) is 1 / x.
value fold_numbers(const std::string& op,
                   const std::vector<value>& args,
                   number_step step,
                   std::int64_t unary_seed,
                   bool reject_zero_divisor) {
    std::vector<number> operands;
    operands.reserve(args.size() + 1);
    if (args.size() == 1) {
        operands.push_back(exact_number(unary_seed));
    }
    for (value arg : args) {
        operands.push_back(to_number(arg, op));
    }

    if (reject_zero_divisor) {
        for (std::size_t i = 1; i < operands.size(); ++i) {
            if (operands[i].is_zero()) {
                throw lisp_error(op + ": division by zero");
            }
        }
    }

    number acc = operands.front();
    for (std::size_t i = 1; i < operands.size(); ++i) {
        acc = step(op, acc, operands[i]);
    }
    return to_value(acc);
}

value builtin_add(const std::vector<value>& args) {
    if (args.empty()) {
        return make_integer(0);
    }
    return fold_numbers("+", args, add, 0, false);
}

value builtin_sub(const std::vector<value>& args) {
    require_min_arity("-", args, 1);
    return fold_numbers("-", args, subtract, 0, false);
}

value builtin_mul(const std::vector<value>& args) {
    if (args.empty()) {
        return make_integer(1);
    }
    return fold_numbers("*", args, multiply, 1, false);
}

value builtin_div(const std::vector<value>& args) {
    require_min_arity("/", args, 1);
    return fold_numbers("/", args, divide, 1, true);
}

// True when every adjacent pair satisfies `holds`. Exact pairs compare as
// integers so large values are not rounded through double.
value numeric_chain(const std::string& op,
                    const std::vector<value>& args,
                    const std::function<bool(int)>& holds) {
    require_min_arity(op, args, 2);
    std::vector<number> operands;
    operands.reserve(args.size());
    for (value arg : args) {
        operands.push_back(to_number(arg, op));
    }

    for (std::size_t i = 1; i < operands.size(); ++i) {
        const number& lhs = operands[i - 1];
        const number& rhs = operands[i];
        int order = 0;
        if (lhs.exact && rhs.exact) {
            order = (lhs.whole > rhs.whole) - (lhs.whole < rhs.whole);
        } else {
            const double l = lhs.as_double();
            const double r = rhs.as_double();
            if (std::isnan(l) || std::isnan(r)) {
                return make_boolean(false);
            }
            order = (l > r) - (l < r);
        }
        if (!holds(order)) {
            return make_boolean(false);
        }
    }
    return make_boolean(true);
}

// A second argument that is not a list is wrapped, so the result is always a
// proper list.
value builtin_cons(const std::vector<value>& args) {
    require_arity("cons", args, 2);
    value rest = args[1];
    if (!is_nil(rest) && !is_cons(rest)) {
        rest = list_from_vector({rest});
    }
    return make_cons(args[0], rest);
}

value pair_part(const std::string& op, const std::vector<value>& args, value (*part)(value)) {
    require_arity(op, args, 1);
    if (!is_cons(args[0])) {
        throw type_error(op + ": expected non-empty list, got " + print_value(args[0]));
    }
    return part(args[0]);
}

value write_out(const std::string& text) {
    std::cout << text << std::flush;
    return make_symbol("ok");
}

}  // namespace

primitive_table core_primitives() {
    return primitive_table{
        {"cons", builtin_cons},
        {"car", [](const std::vector<value>& args) { return pair_part("car", args, car); }},
        {"cdr", [](const std::vector<value>& args) { return pair_part("cdr", args, cdr); }},
        {"null?",
         [](const std::vector<value>& args) {
             require_arity("null?", args, 1);
             return make_boolean(is_nil(args[0]));
         }},
        {"eq?",
         [](const std::vector<value>& args) {
             require_arity("eq?", args, 2);
             return make_boolean(eq_values(args[0], args[1]));
         }},
        {"list", [](const std::vector<value>& args) { return list_from_vector(args); }},
        {"+", builtin_add},
        {"-", builtin_sub},
        {"*", builtin_mul},
        {"/", builtin_div},
        {"=", [](const std::vector<value>& args) { return numeric_chain("=", args, [](int o) { return o == 0; }); }},
        {"<", [](const std::vector<value>& args) { return numeric_chain("<", args, [](int o) { return o < 0; }); }},
        {">", [](const std::vector<value>& args) { return numeric_chain(">", args, [](int o) { return o > 0; }); }},
        {"<=", [](const std::vector<value>& args) { return numeric_chain("<=", args, [](int o) { return o <= 0; }); }},
        {">=", [](const std::vector<value>& args) { return numeric_chain(">=", args, [](int o) { return o >= 0; }); }},
        {"display",
         [](const std::vector<value>& args) {
             require_arity("display", args, 1);
             return write_out(display_value(args[0]));
         }},
        {"newline",
         [](const std::vector<value>& args) {
             require_arity("newline", args, 0);
             return write_out("\n");
         }},
    };
}

}  // namespace scheep
