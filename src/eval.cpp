#include "scheep/eval.hpp"

#include <utility>

#include "scheep/derived_forms.hpp"
#include "scheep/error.hpp"
#include "scheep/gc.hpp"
#include "scheep/logging.hpp"
#include "scheep/printer.hpp"
#include "scheep/reader.hpp"
#include "scheep/special_forms.hpp"

namespace scheep {
namespace {

const special_form_handler* find_special_form(value expr) {
    value head = car(expr);
    if (!is_symbol(head)) {
        return nullptr;
    }
    return default_special_forms().find(symbol_name(head));
}

value eval_application(value expr, env_ptr scope) {
    gc_root_scope roots(default_gc());
    roots.add(&expr);

    if (!is_proper_list(expr)) {
        throw unknown_expression_type(print_value(expr));
    }

    value procedure = eval(car(expr), scope);
    roots.add(&procedure);

    std::vector<value> raw_args = vector_from_list(cdr(expr));
    std::vector<value> evaluated_args;
    evaluated_args.reserve(raw_args.size());
    for (value raw_arg : raw_args) {
        evaluated_args.push_back(eval(raw_arg, scope));
    }
    for (value& arg : evaluated_args) {
        roots.add(&arg);
    }
    return apply_procedure(procedure, evaluated_args);
}

}  // namespace

value eval(value expr, env_ptr scope) {
    if (!expr) {
        throw eval_error("eval: null expression");
    }

    if (is_self_evaluating(expr)) {
        return expr;
    }
    if (is_symbol(expr)) {
        return lookup(scope, symbol_name(expr));
    }
    if (is_cons(expr)) {
        if (const special_form_handler* handler = find_special_form(expr)) {
            return (*handler)(expr, scope);
        }
        if (is_derived_form(expr)) {
            return eval(expand_derived_form(expr), scope);
        }
        return eval_application(expr, scope);
    }

    throw unknown_expression_type(print_value(expr));
}

value eval_sequence(const std::vector<value>& exprs, env_ptr scope) {
    value last = make_nil();
    for (value expr : exprs) {
        last = eval(expr, scope);
    }
    return last;
}

value apply_procedure(value procedure, const std::vector<value>& args) {
    if (!procedure) {
        throw eval_error("apply: null procedure");
    }

    switch (type_of(procedure)) {
        case value_type::primitive_fn:
            return primitive_of(procedure).fn(args);
        case value_type::closure: {
            const compound_procedure& compound = compound_of(procedure);
            if (compound.params.size() != args.size()) {
                throw arity_mismatch("compound procedure", compound.params.size(), args.size());
            }
            env_ptr call_scope = extend_environment(compound.scope, compound.params, args);
            scoped_env_root call_scope_root(default_gc(), call_scope);
            return eval_sequence(compound.body, call_scope);
        }
        case value_type::nil:
        case value_type::boolean:
        case value_type::integer:
        case value_type::floating:
        case value_type::symbol:
        case value_type::string:
        case value_type::cons:
            break;
    }

    throw not_a_procedure(print_value(procedure));
}

value eval_source(std::string_view source, env_ptr scope, const result_observer& on_result) {
    std::vector<value> exprs = read_all(source);

    gc_root_scope roots(default_gc());
    for (value& expr : exprs) {
        roots.add(&expr);
    }
    scoped_env_root scope_root(default_gc(), scope);

    value last = make_nil();
    roots.add(&last);

    for (value expr : exprs) {
        last = eval(expr, scope);
        if (on_result) {
            on_result(last);
        }
        default_gc().maybe_collect();
    }

    return last;
}

env_ptr make_global_environment(const primitive_table& primitives) {
    std::vector<std::string> names;
    std::vector<value> procedures;
    names.reserve(primitives.size());
    procedures.reserve(primitives.size());
    for (const auto& [name, fn] : primitives) {
        if (!fn) {
            throw lisp_error("make_global_environment: primitive " + name + " has no function");
        }
        names.push_back(name);
        procedures.push_back(make_primitive(name, fn));
    }

    env_ptr global = extend_environment(the_empty_environment(), names, procedures);
    define(global, "true", make_boolean(true));
    define(global, "false", make_boolean(false));
    default_gc().register_root_env(global);
    return global;
}

env_ptr create_global_env() {
    return create_global_env(runtime_config{});
}

env_ptr create_global_env(const runtime_config& config) {
    env_ptr global = make_global_environment(core_primitives());

    if (config.extension_register_hook) {
        registrar r(global);
        config.extension_register_hook(&r, config.extension_register_user);
    }

    special_form_registry& forms = default_special_forms();
    if (config.special_form_hook) {
        config.special_form_hook(&forms, config.special_form_user);
    }
    if (config.seal_special_forms) {
        forms.seal();
    }

    log_message(log_level::debug,
                "environment",
                "global environment ready (" + std::to_string(global->first_frame->size()) + " bindings, " +
                    std::to_string(forms.size()) + " special forms)");
    return global;
}

}  // namespace scheep
