#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace scheep {

class lisp_error : public std::runtime_error {
public:
    explicit lisp_error(const std::string& message) : std::runtime_error(message) {}
};

class parse_error : public lisp_error {
public:
    parse_error(const std::string& message, bool incomplete)
        : lisp_error(message), incomplete_(incomplete) {}

    [[nodiscard]] bool incomplete() const noexcept { return incomplete_; }

private:
    bool incomplete_;
};

class eval_error : public lisp_error {
public:
    explicit eval_error(const std::string& message) : lisp_error(message) {}
};

class type_error : public eval_error {
public:
    explicit type_error(const std::string& message) : eval_error(message) {}
};

class unbound_variable : public eval_error {
public:
    explicit unbound_variable(const std::string& name)
        : eval_error("unbound variable: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class not_a_procedure : public type_error {
public:
    explicit not_a_procedure(const std::string& printed_value)
        : type_error("not a procedure: " + printed_value), printed_value_(printed_value) {}

    [[nodiscard]] const std::string& printed_value() const noexcept { return printed_value_; }

private:
    std::string printed_value_;
};

class unknown_expression_type : public eval_error {
public:
    explicit unknown_expression_type(const std::string& printed_expression)
        : eval_error("unknown expression type: " + printed_expression), printed_expression_(printed_expression) {}

    [[nodiscard]] const std::string& printed_expression() const noexcept { return printed_expression_; }

private:
    std::string printed_expression_;
};

class malformed_syntax : public eval_error {
public:
    malformed_syntax(const std::string& form, const std::string& detail)
        : eval_error(form + ": " + detail), form_(form) {}

    [[nodiscard]] const std::string& form() const noexcept { return form_; }

private:
    std::string form_;
};

class arity_mismatch : public eval_error {
public:
    arity_mismatch(const std::string& where, std::size_t expected, std::size_t got)
        : eval_error(where + ": expected " + std::to_string(expected) + " arguments, got " + std::to_string(got)),
          expected_(expected),
          got_(got) {}

    [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::size_t got() const noexcept { return got_; }

private:
    std::size_t expected_;
    std::size_t got_;
};

}  // namespace scheep
