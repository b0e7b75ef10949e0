#include "scheep/special_forms.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "scheep/env.hpp"
#include "scheep/error.hpp"
#include "scheep/eval.hpp"
#include "scheep/logging.hpp"

namespace scheep {
namespace {

void expect_exact(const std::string& name, const std::vector<value>& args, std::size_t expected) {
    if (args.size() != expected) {
        throw malformed_syntax(name, "expected " + std::to_string(expected) + " operands, got " + std::to_string(args.size()));
    }
}

void expect_min(const std::string& name, const std::vector<value>& args, std::size_t minimum) {
    if (args.size() < minimum) {
        throw malformed_syntax(name, "expected at least " + std::to_string(minimum) + " operands, got " +
                                         std::to_string(args.size()));
    }
}

value ok_symbol() {
    return make_symbol("ok");
}

std::vector<std::string> parse_params(const std::string& form_name, const std::vector<value>& param_values) {
    std::vector<std::string> params;
    std::unordered_set<std::string> seen;
    params.reserve(param_values.size());
    for (value entry : param_values) {
        if (!is_symbol(entry)) {
            throw malformed_syntax(form_name, "parameters must be symbols");
        }
        if (!seen.insert(symbol_name(entry)).second) {
            throw malformed_syntax(form_name, "duplicate parameter " + symbol_name(entry));
        }
        params.push_back(symbol_name(entry));
    }
    return params;
}

value eval_quote(value expr, env_ptr) {
    const auto args = form_arguments(expr, "quote");
    expect_exact("quote", args, 1);
    return args[0];
}

value eval_assignment(value expr, env_ptr scope) {
    const auto args = form_arguments(expr, "set!");
    expect_exact("set!", args, 2);
    if (!is_symbol(args[0])) {
        throw malformed_syntax("set!", "target must be a symbol");
    }
    value assigned = eval(args[1], scope);
    assign(scope, symbol_name(args[0]), assigned);
    return ok_symbol();
}

value eval_definition(value expr, env_ptr scope) {
    const auto args = form_arguments(expr, "define");
    expect_min("define", args, 2);

    if (is_symbol(args[0])) {
        expect_exact("define", args, 2);
        value bound = eval(args[1], scope);
        define(scope, symbol_name(args[0]), bound);
        return ok_symbol();
    }

    if (is_cons(args[0])) {
        if (!is_proper_list(args[0])) {
            throw malformed_syntax("define", "invalid procedure signature");
        }
        const auto signature = vector_from_list(args[0]);
        if (!is_symbol(signature[0])) {
            throw malformed_syntax("define", "procedure name must be a symbol");
        }

        const std::vector<value> param_values(signature.begin() + 1, signature.end());
        const auto params = parse_params("define", param_values);
        const std::vector<value> body(args.begin() + 1, args.end());
        define(scope, symbol_name(signature[0]), make_closure(params, body, scope));
        return ok_symbol();
    }

    throw malformed_syntax("define", "first operand must be a symbol or procedure signature");
}

value eval_if(value expr, env_ptr scope) {
    const auto args = form_arguments(expr, "if");
    if (args.size() != 2 && args.size() != 3) {
        throw malformed_syntax("if", "expected 2 or 3 operands, got " + std::to_string(args.size()));
    }
    if (is_truthy(eval(args[0], scope))) {
        return eval(args[1], scope);
    }
    if (args.size() == 3) {
        return eval(args[2], scope);
    }
    return make_boolean(false);
}

value eval_lambda(value expr, env_ptr scope) {
    const auto args = form_arguments(expr, "lambda");
    expect_min("lambda", args, 2);
    if (!is_proper_list(args[0])) {
        throw malformed_syntax("lambda", "parameter list must be a proper list");
    }
    const auto params = parse_params("lambda", vector_from_list(args[0]));
    const std::vector<value> body(args.begin() + 1, args.end());
    return make_closure(params, body, scope);
}

value eval_begin(value expr, env_ptr scope) {
    const auto args = form_arguments(expr, "begin");
    expect_min("begin", args, 1);
    return eval_sequence(args, scope);
}

}  // namespace

void special_form_registry::register_form(const std::string& tag, special_form_handler handler) {
    if (sealed_) {
        throw lisp_error("register_special_form: registry is sealed, cannot register " + tag);
    }
    if (tag.empty()) {
        throw lisp_error("register_special_form: tag must not be empty");
    }
    if (!handler) {
        throw lisp_error("register_special_form: handler for " + tag + " must not be empty");
    }
    handlers_[tag] = std::move(handler);
    log_message(log_level::debug, "special-forms", "registered " + tag);
}

const special_form_handler* special_form_registry::find(const std::string& tag) const {
    const auto it = handlers_.find(tag);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool special_form_registry::contains(const std::string& tag) const {
    return handlers_.find(tag) != handlers_.end();
}

void special_form_registry::seal() {
    if (sealed_) {
        return;
    }
    sealed_ = true;
    log_message(log_level::info, "special-forms", "sealed with " + std::to_string(handlers_.size()) + " forms");
}

std::vector<std::string> special_form_registry::tags() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [tag, _] : handlers_) {
        out.push_back(tag);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void install_core_special_forms(special_form_registry& registry) {
    registry.register_form("quote", eval_quote);
    registry.register_form("set!", eval_assignment);
    registry.register_form("define", eval_definition);
    registry.register_form("if", eval_if);
    registry.register_form("lambda", eval_lambda);
    registry.register_form("begin", eval_begin);
}

special_form_registry& default_special_forms() {
    static special_form_registry registry = [] {
        special_form_registry core;
        install_core_special_forms(core);
        return core;
    }();
    return registry;
}

void register_special_form(const std::string& tag, special_form_handler handler) {
    default_special_forms().register_form(tag, std::move(handler));
}

std::vector<value> form_arguments(value expr, const std::string& form_name) {
    if (!is_cons(expr) || !is_proper_list(expr)) {
        throw malformed_syntax(form_name, "form must be a proper list");
    }
    return vector_from_list(cdr(expr));
}

}  // namespace scheep
