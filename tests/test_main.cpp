#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "scheep/derived_forms.hpp"
#include "scheep/env.hpp"
#include "scheep/error.hpp"
#include "scheep/eval.hpp"
#include "scheep/gc.hpp"
#include "scheep/logging.hpp"
#include "scheep/pattern.hpp"
#include "scheep/printer.hpp"
#include "scheep/reader.hpp"
#include "scheep/special_forms.hpp"

namespace {

void check(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

scheep::value eval_text(const std::string& source, scheep::env_ptr env) {
    return scheep::eval_source(source, env);
}

std::int64_t eval_int(const std::string& source, scheep::env_ptr env) {
    scheep::value result = eval_text(source, env);
    check(scheep::is_integer(result), "expected integer result from " + source + ", got " + scheep::print_value(result));
    return scheep::integer_value(result);
}

template <typename Error>
void expect_error(const std::function<void()>& fn, const std::string& message) {
    try {
        fn();
    } catch (const Error&) {
        return;
    }
    throw std::runtime_error(message);
}

class cout_capture {
public:
    cout_capture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~cout_capture() { std::cout.rdbuf(previous_); }

    cout_capture(const cout_capture&) = delete;
    cout_capture& operator=(const cout_capture&) = delete;

    [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

void test_reader_basics() {
    using namespace scheep;

    check(integer_value(read_one("42")) == 42, "integer parse failed");
    check(boolean_value(read_one("#t")), "#t parse failed");
    check(!boolean_value(read_one("#f")), "#f parse failed");
    check(is_float(read_one("3.5")), "3.5 should parse as float");
    check(is_symbol(read_one("...")), "... should parse as a symbol");
    check(is_symbol(read_one("else")), "else should parse as a symbol");

    check(print_value(read_one("'x")) == "(quote x)", "quote sugar parse failed");
    check(print_value(read_one("(1 (2 3) ())")) == "(1 (2 3) ())", "nested list parse failed");
    check(string_value(read_one("\"hi\\nthere\"")) == "hi\nthere", "string parse failed");
    check(read_all("1 ; comment\n2").size() == 2, "comment handling failed");

    try {
        (void)read_all("(");
        throw std::runtime_error("expected parse error for incomplete list");
    } catch (const parse_error& e) {
        check(e.incomplete(), "incomplete parse should be marked incomplete");
    }

    expect_error<parse_error>([] { (void)read_one("(a . b)"); }, "dotted pairs should be rejected by the reader");
    expect_error<parse_error>([] { (void)read_one("\"a\\qb\""); }, "unknown string escape should be rejected");
    expect_error<parse_error>([] { (void)read_one("1 2"); }, "read_one should reject two expressions");

    try {
        (void)read_all("(a\n  b))");
        throw std::runtime_error("expected parse error for stray ')'");
    } catch (const parse_error& e) {
        check(!e.incomplete(), "stray ')' is not an incomplete parse");
        check(std::string(e.what()).rfind("line 2, column 5:", 0) == 0,
              std::string("stray ')' position mismatch: ") + e.what());
    }

    check(integer_value(read_one("+5")) == 5, "explicit plus sign should parse as integer");
    check(integer_value(read_one("-5")) == -5, "negative integer parse failed");
    check(is_symbol(read_one("-")), "lone minus should parse as a symbol");
    check(is_float(read_one("1e3")), "exponent should parse as float");
    check(is_symbol(read_one("a.b")), "dotted identifier should parse as a symbol");
}

void test_printer() {
    using namespace scheep;

    check(print_value(make_float(2.0)) == "2.0", "whole float should keep a fraction");
    check(print_value(make_float(0.1)) == "0.1", "float should print shortest form");
    check(print_value(read_one("\"a\\\"b\\nc\"")) == "\"a\\\"b\\nc\"", "string escapes should round trip");
    check(display_value(read_one("\"a\\\"b\"")) == "a\"b", "display should write raw string contents");
    check(print_value(make_cons(make_integer(1), make_integer(2))) == "(1 . 2)", "improper tail should print dotted");
    check(print_value(read_one("(quote (#t #f ()))")) == "(quote (#t #f ()))", "nested list print mismatch");

    env_ptr env = create_global_env();
    check(print_value(eval_text("car", env)) == "<primitive:car>", "primitive print mismatch");
    check(print_value(eval_text("(lambda (a b) a)", env)) == "<compound-procedure:2>", "closure print mismatch");
}

void test_eval_source_reports_each_result() {
    using namespace scheep;

    env_ptr env = create_global_env();
    std::vector<std::string> seen;
    const value last = eval_source("(define x 2) (+ x 1) \"done\"", env, [&](value result) {
        seen.push_back(print_value(result));
    });
    check(seen == std::vector<std::string>{"ok", "3", "\"done\""}, "top-level results should be reported in order");
    check(string_value(last) == "done", "eval_source should return the last value");

    seen.clear();
    const auto record = [&](value result) { seen.push_back(print_value(result)); };
    expect_error<parse_error>([&] { (void)eval_source("(define y 1) (", env, record); },
                              "incomplete source should fail to parse");
    check(seen.empty(), "nothing should be evaluated when the source does not parse");
    expect_error<unbound_variable>([&] { (void)eval_text("y", env); }, "a form from unparsed source must not run");
}

void test_literals_evaluate_to_themselves() {
    using namespace scheep;

    env_ptr env = create_global_env();
    for (const char* literal : {"7", "-3", "2.5", "\"text\"", "#t", "#f"}) {
        value expr = read_one(literal);
        check(eval(expr, env) == expr, std::string("literal should evaluate to itself: ") + literal);
    }

    value in_empty = read_one("11");
    check(eval(in_empty, the_empty_environment()) == in_empty, "literals evaluate in the empty environment");
}

void test_unbound_variable() {
    using namespace scheep;

    env_ptr env = create_global_env();
    try {
        (void)eval_text("missing-symbol", env);
        throw std::runtime_error("expected unbound_variable");
    } catch (const unbound_variable& e) {
        check(e.name() == "missing-symbol", "unbound_variable should carry the name");
    }

    expect_error<unbound_variable>([] { (void)eval(make_symbol("x"), the_empty_environment()); },
                                   "lookup in the empty environment should fail");
}

void test_define_and_lookup() {
    using namespace scheep;

    env_ptr env = create_global_env();
    value result = eval_text("(define x 10)", env);
    check(is_symbol_named(result, "ok"), "define should return ok");
    check(eval_int("x", env) == 10, "defined variable lookup failed");

    eval_text("(define x 11)", env);
    check(eval_int("x", env) == 11, "redefinition should overwrite in place");

    eval_text("(define (square n) (* n n))", env);
    check(eval_int("(square 9)", env) == 81, "procedure definition sugar failed");

    eval_text("(define (two-step n) (define m (+ n 1)) (* m 2))", env);
    check(eval_int("(two-step 4)", env) == 10, "multi-expression body failed");
}

void test_assignment_semantics() {
    using namespace scheep;

    env_ptr env = create_global_env();
    expect_error<unbound_variable>([&] { (void)eval_text("(set! nowhere 1)", env); },
                                   "set! of an undefined variable should fail");
    expect_error<unbound_variable>([&] { (void)eval_text("nowhere", env); }, "failed set! must not define");

    eval_text("(define counter 0)", env);
    eval_text("(define (bump) (set! counter (+ counter 1)) counter)", env);
    check(eval_int("(bump)", env) == 1, "set! through closure failed");
    check(eval_int("(bump)", env) == 2, "second set! failed");
    check(eval_int("counter", env) == 2, "global should observe set! from nested frame");

    eval_text("(define (peek) counter)", env);
    eval_text("(set! counter 40)", env);
    check(eval_int("(peek)", env) == 40, "nested frame should observe outer set!");
}

void test_define_shadows_outer_binding() {
    using namespace scheep;

    env_ptr env = create_global_env();
    eval_text("(define y 1)", env);
    eval_text("(define (shadow) (define y 2) y)", env);
    check(eval_int("(shadow)", env) == 2, "inner define should be visible inside");
    check(eval_int("y", env) == 1, "inner define must not mutate outer binding");

    eval_text("(define (param-shadow y) (set! y 99) y)", env);
    check(eval_int("(param-shadow 5)", env) == 99, "set! on parameter failed");
    check(eval_int("y", env) == 1, "set! on parameter must not touch global");
}

void test_truthiness() {
    using namespace scheep;

    env_ptr env = create_global_env();
    check(eval_int("(if 0 1 2)", env) == 1, "0 should be truthy");
    check(eval_int("(if '() 1 2)", env) == 1, "empty list should be truthy");
    check(eval_int("(if \"\" 1 2)", env) == 1, "empty string should be truthy");
    check(eval_int("(if false 1 2)", env) == 2, "false should be falsey");
    check(eval_int("(if #f 1 2)", env) == 2, "#f should be falsey");
    check(eval_int("(if true 1 2)", env) == 1, "true should be truthy");

    value missing_alternative = eval_text("(if false 1)", env);
    check(is_boolean(missing_alternative) && !boolean_value(missing_alternative), "if without alternative should be #f");
}

void test_closures_capture_definition_environment() {
    using namespace scheep;

    env_ptr env = create_global_env();
    eval_text("(define adder (lambda (n) (lambda (x) (+ x n))))", env);
    check(eval_int("((adder 5) 3)", env) == 8, "closure application failed");

    value adder = lookup(env, "adder");
    value add_five = apply_procedure(adder, {make_integer(5)});
    gc_root_scope roots(default_gc());
    roots.add(&add_five);
    value sum = apply_procedure(add_five, {make_integer(3)});
    check(integer_value(sum) == 8, "apply_procedure closure chain failed");

    eval_text("(define n 1000)", env);
    check(integer_value(apply_procedure(add_five, {make_integer(1)})) == 6, "closure must use captured n, not global");
}

void test_cond_rewrite() {
    using namespace scheep;

    env_ptr env = create_global_env();
    check(eval_int("(cond (false 1) (else 2))", env) == 2, "cond else branch failed");
    check(eval_int("(cond ((= 1 1) 10) (else 20))", env) == 10, "cond first branch failed");
    check(eval_int("(cond (false 1) (true 2 3))", env) == 3, "cond multi-action clause failed");

    value no_match = eval_text("(cond (false 1) ((= 1 2) 2))", env);
    check(is_boolean(no_match) && !boolean_value(no_match), "cond with no match should be #f");

    eval_text("(define hits 0)", env);
    expect_error<malformed_syntax>(
        [&] { (void)eval_text("(cond ((begin (set! hits 1) true) 1) (else 2) (true 3))", env); },
        "non-final else should be malformed");
    check(eval_int("hits", env) == 0, "cond must be rejected before any clause is evaluated");

    check(print_value(expand_cond(read_one("(cond (a 1 2) (b 3) (else 4))"))) == "(if a (begin 1 2) (if b 3 4))",
          "cond expansion shape mismatch");
    check(print_value(expand_cond(read_one("(cond (a))"))) == "(if a () #f)", "empty action should collapse to ()");
    check(print_value(expand_cond(read_one("(cond)"))) == "#f", "empty cond should rewrite to #f");
    expect_error<malformed_syntax>([] { (void)expand_cond(read_one("(cond 5)")); }, "non-list clause should be malformed");
}

void test_operand_evaluation_order() {
    using namespace scheep;

    env_ptr env = create_global_env();
    eval_text("(define trace '())", env);
    eval_text("(define (note x) (set! trace (cons x trace)) x)", env);
    check(print_value(eval_text("(list (note 1) (note 2) (note 3))", env)) == "(1 2 3)", "list result mismatch");
    check(print_value(eval_text("trace", env)) == "(3 2 1)", "operands should be evaluated left to right");
}

void test_arity_mismatch() {
    using namespace scheep;

    env_ptr env = create_global_env();
    eval_text("(define (pair-up a b) (list a b))", env);
    try {
        (void)eval_text("(pair-up 1)", env);
        throw std::runtime_error("expected arity_mismatch");
    } catch (const arity_mismatch& e) {
        check(e.expected() == 2 && e.got() == 1, "arity_mismatch should report expected and got");
    }
    expect_error<arity_mismatch>([&] { (void)eval_text("(pair-up 1 2 3)", env); }, "extra argument should fail");
    expect_error<arity_mismatch>([] { (void)extend_environment(the_empty_environment(), {"a", "b"}, {make_integer(1)}); },
                                 "extend_environment should reject mismatched lengths");
}

void test_not_a_procedure_and_unknown_expressions() {
    using namespace scheep;

    env_ptr env = create_global_env();
    expect_error<not_a_procedure>([&] { (void)eval_text("(1 2)", env); }, "calling a number should fail");
    expect_error<not_a_procedure>([&] { (void)eval_text("(\"f\")", env); }, "calling a string should fail");
    try {
        (void)apply_procedure(make_symbol("nope"), {});
        throw std::runtime_error("expected not_a_procedure");
    } catch (const not_a_procedure& e) {
        check(e.printed_value() == "nope", "not_a_procedure should carry the printed value");
    }

    expect_error<unknown_expression_type>([&] { (void)eval(make_nil(), env); }, "() should not be evaluable");
    expect_error<unknown_expression_type>([&] { (void)eval(lookup(env, "car"), env); },
                                          "procedure objects are not expressions");
    expect_error<unknown_expression_type>([&] { (void)eval(make_cons(make_symbol("car"), make_integer(1)), env); },
                                          "improper application should not be evaluable");
}

void test_malformed_special_forms() {
    using namespace scheep;

    env_ptr env = create_global_env();
    const std::vector<std::string> bad_forms = {
        "(if)",
        "(if 1 2 3 4)",
        "(lambda)",
        "(lambda (x))",
        "(lambda (x x) x)",
        "(lambda (1) 1)",
        "(define)",
        "(define x)",
        "(define 5 1)",
        "(begin)",
        "(quote 1 2)",
        "(set! 5 1)",
    };
    for (const auto& form : bad_forms) {
        expect_error<malformed_syntax>([&] { (void)eval_text(form, env); }, "expected malformed_syntax for " + form);
    }
}

void test_recursion() {
    using namespace scheep;

    env_ptr env = create_global_env();
    eval_text("(define (fact n) (if (= n 0) 1 (* n (fact (- n 1)))))", env);
    check(eval_int("(fact 10)", env) == 3628800, "factorial failed");

    eval_text("(define (fib n) (cond ((< n 2) n) (else (+ (fib (- n 1)) (fib (- n 2))))))", env);
    check(eval_int("(fib 15)", env) == 610, "fib failed");

    eval_text("(define (len xs) (if (null? xs) 0 (+ 1 (len (cdr xs)))))", env);
    check(eval_int("(len (list 1 2 3 4))", env) == 4, "list recursion failed");
}

void test_special_form_registry() {
    using namespace scheep;

    env_ptr env = create_global_env();
    register_special_form("unless", [](value expr, env_ptr scope) {
        const auto args = form_arguments(expr, "unless");
        if (args.size() != 2) {
            throw malformed_syntax("unless", "expected 2 operands");
        }
        if (is_truthy(eval(args[0], scope))) {
            return make_boolean(false);
        }
        return eval(args[1], scope);
    });
    check(eval_int("(unless false 5)", env) == 5, "registered special form should be dispatched");
    check(eval_int("(begin (define unless 3) (unless false 6))", env) == 6,
          "special forms take precedence over variables");

    special_form_registry local;
    install_core_special_forms(local);
    check(local.tags() == std::vector<std::string>{"begin", "define", "if", "lambda", "quote", "set!"},
          "core special forms mismatch");
    check(!local.contains("cond"), "cond must be a derived form, not a handler");
    local.seal();
    check(local.sealed(), "registry should report sealed");
    expect_error<lisp_error>([&] { local.register_form("late", [](value, env_ptr) { return make_nil(); }); },
                             "registering into a sealed registry should fail");
    expect_error<lisp_error>([] { register_special_form("empty-handler", special_form_handler{}); },
                             "empty handlers should be rejected");
}

void test_runtime_config_hooks() {
    using namespace scheep;

    runtime_config config;
    config.extension_register_hook = [](registrar* r, void* user) {
        r->register_builtin("double", [](const std::vector<value>& args) {
            return make_integer(integer_value(args.at(0)) * 2);
        });
        r->register_value("answer", make_integer(42));
        *static_cast<int*>(user) += 1;
    };
    int calls = 0;
    config.extension_register_user = &calls;
    config.special_form_hook = [](special_form_registry* registry, void*) {
        registry->register_form("always-seven", [](value, env_ptr) { return make_integer(7); });
    };

    env_ptr env = create_global_env(config);
    check(calls == 1, "extension hook should run once");
    check(eval_int("(double answer)", env) == 84, "extension builtins should be callable");
    check(eval_int("(always-seven ignored)", env) == 7, "special form hook should register forms");

    runtime_config duplicate;
    duplicate.extension_register_hook = [](registrar* r, void*) {
        r->register_builtin("car", [](const std::vector<value>&) { return make_nil(); });
    };
    expect_error<lisp_error>([&] { (void)create_global_env(duplicate); }, "registrar should refuse existing globals");
}

void test_global_environment_construction() {
    using namespace scheep;

    primitive_table table;
    table["inc"] = [](const std::vector<value>& args) { return make_integer(integer_value(args.at(0)) + 1); };
    env_ptr env = make_global_environment(table);

    check(eval_int("(inc 41)", env) == 42, "custom primitive table should be bound");
    check(boolean_value(eval_text("true", env)), "true should be bound");
    check(!boolean_value(eval_text("false", env)), "false should be bound");
    check(env->enclosing == the_empty_environment(), "global environment should have exactly one frame");
    expect_error<unbound_variable>([&] { (void)eval_text("car", env); }, "core primitives should not leak in");
}

void test_environment_model() {
    using namespace scheep;

    env_ptr global = extend_environment(the_empty_environment(), {"x"}, {make_integer(1)});
    env_ptr child = extend_environment(global, {"y"}, {make_integer(2)});
    env_ptr sibling = extend_environment(global, {}, {});

    check(integer_value(lookup(child, "x")) == 1, "lookup should walk to the outer frame");
    check(integer_value(lookup(child, "y")) == 2, "lookup in innermost frame failed");
    expect_error<unbound_variable>([&] { (void)lookup(global, "y"); }, "child bindings must not leak outward");

    assign(child, "x", make_integer(5));
    check(integer_value(lookup(sibling, "x")) == 5, "assign should mutate the shared outer frame");

    define(child, "x", make_integer(9));
    check(integer_value(lookup(child, "x")) == 9, "define should shadow in the innermost frame");
    check(integer_value(lookup(global, "x")) == 5, "define must not touch the outer frame");

    check(find_binding_frame(child, "x") == child->first_frame, "shadowing binding should be found first");
    check(find_binding_frame(sibling, "x") == global->first_frame, "outer binding frame mismatch");
    check(find_binding_frame(child, "zzz") == nullptr, "unbound name should have no frame");

    expect_error<unbound_variable>([&] { assign(child, "zzz", make_integer(0)); }, "assign of unbound name should fail");
    expect_error<lisp_error>([] { define(the_empty_environment(), "x", make_integer(1)); },
                             "define into the empty environment should fail");
}

void test_frame_updates_are_atomic() {
    using namespace scheep;

    env_ptr scope = make_env();
    value first = make_integer(1);
    value second = make_integer(2);
    define(scope, "shared", first);
    frame_ptr target = scope->first_frame;

    bool torn = false;
    std::thread writer([&] {
        for (int i = 0; i < 20000; ++i) {
            target->put("shared", (i % 2 == 0) ? second : first);
            target->put("key-" + std::to_string(i % 64), first);
        }
    });
    for (int i = 0; i < 20000; ++i) {
        const auto seen = target->get("shared");
        if (!seen || (*seen != first && *seen != second)) {
            torn = true;
        }
    }
    writer.join();

    check(!torn, "reader observed a partially applied frame update");
    check(target->size() == 65, "frame should hold the shared key plus 64 distinct keys");
}

void test_pattern_match_basics() {
    using namespace scheep;

    env_ptr env = make_env();
    const auto matched = match_pattern(read_one("(a b)"), read_one("(1 2)"), {}, env, env);
    check(matched.has_value(), "(a b) should match (1 2)");
    check(matched->size() == 2, "expected two bindings");
    check(matched->at("a").size() == 1 && integer_value(matched->at("a")[0]) == 1, "a binding mismatch");
    check(matched->at("b").size() == 1 && integer_value(matched->at("b")[0]) == 2, "b binding mismatch");

    check(!match_pattern(read_one("(a b)"), read_one("(1)"), {}, env, env), "short form should not match");
    check(!match_pattern(read_one("(a)"), read_one("(1 2)"), {}, env, env), "leftover form should not match");
    check(match_pattern(read_one("()"), read_one("()"), {}, env, env).has_value(), "empty should match empty");
    check(!match_pattern(read_one("(a)"), read_one("5"), {}, env, env), "atom form should not match a list");

    const auto nested = match_pattern(read_one("(_ (x y) z)"), read_one("(m (1 (2)) 3)"), {}, env, env);
    check(nested.has_value(), "sublist pattern should match");
    check(print_value(nested->at("y")[0]) == "(2)", "sublist variable mismatch");
    check(integer_value(nested->at("z")[0]) == 3, "variable after sublist mismatch");
    check(!match_pattern(read_one("((x y))"), read_one("(5)"), {}, env, env), "sublist vs atom should fail");
    check(!match_pattern(read_one("((x y))"), read_one("((1))"), {}, env, env), "failed sublist should fail the match");

    check(match_pattern(read_one("(1 \"s\" x)"), read_one("(1 \"s\" 2)"), {}, env, env).has_value(), "datum should match");
    check(!match_pattern(read_one("(1 x)"), read_one("(2 2)"), {}, env, env), "different datum should fail");
}

void test_pattern_match_ellipsis() {
    using namespace scheep;

    env_ptr env = make_env();
    const auto matched = match_pattern(read_one("(a ...)"), read_one("(1 2 3)"), {}, env, env);
    check(matched.has_value(), "(a ...) should match (1 2 3)");
    check(print_value(list_from_vector(matched->at("a"))) == "(1 2 3)", "ellipsis should accumulate in order");

    const auto none = match_pattern(read_one("(k a ...)"), read_one("(0)"), {}, env, env);
    check(none.has_value() && none->at("a").empty(), "ellipsis over zero forms should bind an empty sequence");

    const auto pairs = match_pattern(read_one("((n v) ...)"), read_one("((a 1) (b 2))"), {}, env, env);
    check(pairs.has_value(), "sublist ellipsis should match");
    check(print_value(list_from_vector(pairs->at("n"))) == "(a b)", "n accumulation mismatch");
    check(print_value(list_from_vector(pairs->at("v"))) == "(1 2)", "v accumulation mismatch");

    check(!match_pattern(read_one("((n v) ...)"), read_one("((a 1) b)"), {}, env, env),
          "one failing repetition should fail the match");

    expect_error<malformed_syntax>([&] { (void)match_pattern(read_one("(a ... b)"), read_one("(1 2)"), {}, env, env); },
                                   "ellipsis must be last");
    expect_error<malformed_syntax>([&] { (void)match_pattern(read_one("(...)"), read_one("()"), {}, env, env); },
                                   "ellipsis needs a sub-pattern");
}

void test_pattern_match_literals() {
    using namespace scheep;

    env_ptr def_env = make_env();
    env_ptr use_env = make_env(def_env);
    const std::vector<std::string> literals = {"if"};

    const auto unbound_both = match_pattern(read_one("(if x)"), read_one("(if 5)"), literals, def_env, use_env);
    check(unbound_both.has_value(), "literal unbound in both environments should match");
    check(unbound_both->size() == 1 && integer_value(unbound_both->at("x")[0]) == 5, "literal must not be bound");

    check(!match_pattern(read_one("(if x)"), read_one("(when 5)"), literals, def_env, use_env),
          "different identifier should not match a literal");
    check(!match_pattern(read_one("(if x)"), read_one("(5 5)"), literals, def_env, use_env),
          "non-symbol should not match a literal");

    define(def_env, "if", make_integer(1));
    check(match_pattern(read_one("(if x)"), read_one("(if 5)"), literals, def_env, use_env).has_value(),
          "literal resolving to the same binding should match");

    define(use_env, "if", make_integer(1));
    check(!match_pattern(read_one("(if x)"), read_one("(if 5)"), literals, def_env, use_env),
          "literal shadowed at the use site should not match");

    value shared = make_integer(7);
    env_ptr left = make_env();
    env_ptr right = make_env();
    define(left, "if", shared);
    define(right, "if", shared);
    check(!match_pattern(read_one("(if x)"), read_one("(if 5)"), literals, left, right),
          "the same value bound in two frames is two bindings");
}

void test_merge_bindings() {
    using namespace scheep;

    match_bindings lhs{{"a", {make_integer(1)}}};
    match_bindings rhs{{"a", {make_integer(2)}}, {"b", {make_integer(3)}}};
    const match_bindings merged = merge_bindings(lhs, rhs);
    check(print_value(list_from_vector(merged.at("a"))) == "(1 2)", "merge should concatenate lhs first");
    check(merged.at("b").size() == 1, "merge should keep rhs-only keys");

    check(pattern_variables(read_one("(a (b ...) lit a)"), {"lit"}) == std::vector<std::string>{"a", "b"},
          "pattern variable collection mismatch");
    check(classify_pattern(read_one("(x ...)"), {}) == pattern_node_kind::ellipsis, "ellipsis classification failed");
    check(classify_pattern(read_one("(lit)"), {"lit"}) == pattern_node_kind::literal, "literal classification failed");
    check(classify_pattern(make_nil(), {}) == pattern_node_kind::empty, "empty classification failed");
}

void test_closures_survive_collection() {
    using namespace scheep;

    env_ptr env = create_global_env();
    eval_text("(define (make-counter) (define n 0) (lambda () (set! n (+ n 1)) n))", env);
    eval_text("(define c (make-counter))", env);
    eval_text("(c)", env);
    default_gc().collect();
    const gc_stats_snapshot stats = default_gc().stats();
    check(stats.live_objects_after_last_gc > 0, "gc stats should report live objects");
    check(stats.live_objects_after_last_gc == default_gc().live_nodes(), "live count should match the heap");
    check(stats.collections > 0, "collection count should advance");
    check(eval_int("(c)", env) == 2, "closure frame should survive collection");

    eval_text("(define (build n acc) (if (= n 0) acc (build (- n 1) (cons n acc))))", env);
    eval_text("(define big (build 500 '()))", env);
    default_gc().collect();
    check(eval_int("(car big)", env) == 1, "long list should survive collection");
    check(eval_int("(car (cdr big))", env) == 2, "long list tail should survive collection");
}

void test_display_and_newline() {
    using namespace scheep;

    env_ptr env = create_global_env();
    cout_capture capture;
    eval_text("(display \"hi\") (newline) (display (list 1 \"a\"))", env);
    check(capture.text() == "hi\n(1 a)", "display/newline output mismatch: " + capture.text());
}

void test_list_primitives() {
    using namespace scheep;

    env_ptr env = create_global_env();
    check(print_value(eval_text("(cons 1 '(2 3))", env)) == "(1 2 3)", "cons onto list failed");
    check(print_value(eval_text("(cons 1 2)", env)) == "(1 2)", "cons onto non-list should wrap");
    check(eval_int("(car (cdr (list 1 2 3)))", env) == 2, "car/cdr failed");
    check(boolean_value(eval_text("(null? '())", env)), "null? failed");
    check(eval_int("(/ 12 4)", env) == 3, "exact division failed");
    check(is_float(eval_text("(/ 1 2)", env)), "inexact division should be float");
    check(print_value(eval_text("(/ 7 2)", env)) == "3.5", "inexact quotient mismatch");
    check(print_value(eval_text("(/ 2)", env)) == "0.5", "single-operand division is a reciprocal");
    expect_error<lisp_error>([&] { (void)eval_text("(/ 6 2 0)", env); }, "exact zero divisor should fail");
    expect_error<lisp_error>([&] { (void)eval_text("(/ 7 2 0)", env); },
                             "zero divisor after an inexact step should still fail");
    expect_error<lisp_error>([&] { (void)eval_text("(/ 1 0.0)", env); }, "float zero divisor should fail");
    expect_error<lisp_error>([&] { (void)eval_text("(/ 0)", env); }, "reciprocal of zero should fail");
    expect_error<type_error>([&] { (void)eval_text("(car '())", env); }, "car of empty list should fail");
    expect_error<type_error>([&] { (void)eval_text("(+ 1 \"a\")", env); }, "adding a string should fail");
}

void test_logging() {
    using namespace scheep;

    auto sink = std::make_shared<memory_log_sink>(3);
    set_log_sink(sink);

    special_form_registry local;
    local.register_form("one", [](value, env_ptr) { return make_nil(); });
    local.seal();
    log_message(log_level::warn, "test", "a");
    log_message(log_level::error, "test", "b");

    set_log_sink(nullptr);
    log_message(log_level::error, "test", "dropped");

    const auto records = sink->snapshot();
    check(sink->capacity() == 3 && records.size() == 3, "ring sink should keep the newest records");
    check(records[0].category == "special-forms" && records[0].level == log_level::info, "seal record mismatch");
    check(records[2].message == "b" && records[2].sequence == 4, "sequence numbers should count every write");
    check(std::string(log_level_name(log_level::warn)) == "warn", "log level name mismatch");

    std::ostringstream out;
    stream_log_sink stream(out, log_level::warn);
    log_record rec;
    rec.level = log_level::debug;
    rec.category = "x";
    rec.message = "hidden";
    stream.write(rec);
    rec.level = log_level::error;
    rec.message = "shown";
    stream.write(rec);
    check(out.str() == "[error] x: shown\n", "stream sink filtering mismatch: " + out.str());
}

}  // namespace

int main() {
    const std::vector<std::pair<std::string, std::function<void()>>> tests = {
        {"reader basics", test_reader_basics},
        {"printer", test_printer},
        {"eval_source reports each result", test_eval_source_reports_each_result},
        {"literals evaluate to themselves", test_literals_evaluate_to_themselves},
        {"unbound variable", test_unbound_variable},
        {"define and lookup", test_define_and_lookup},
        {"set! semantics", test_assignment_semantics},
        {"define shadows outer binding", test_define_shadows_outer_binding},
        {"truthiness", test_truthiness},
        {"closures capture definition env", test_closures_capture_definition_environment},
        {"cond rewrite", test_cond_rewrite},
        {"operand evaluation order", test_operand_evaluation_order},
        {"arity mismatch", test_arity_mismatch},
        {"not-a-procedure and unknown expressions", test_not_a_procedure_and_unknown_expressions},
        {"malformed special forms", test_malformed_special_forms},
        {"recursion", test_recursion},
        {"special form registry", test_special_form_registry},
        {"runtime config hooks", test_runtime_config_hooks},
        {"global environment construction", test_global_environment_construction},
        {"environment model", test_environment_model},
        {"frame updates are atomic", test_frame_updates_are_atomic},
        {"pattern match basics", test_pattern_match_basics},
        {"pattern match ellipsis", test_pattern_match_ellipsis},
        {"pattern match literals", test_pattern_match_literals},
        {"merge bindings", test_merge_bindings},
        {"closures survive collection", test_closures_survive_collection},
        {"display and newline", test_display_and_newline},
        {"list primitives", test_list_primitives},
        {"logging", test_logging},
    };

    std::size_t passed = 0;
    for (const auto& [name, test_fn] : tests) {
        try {
            test_fn();
            ++passed;
            std::cout << "[PASS] " << name << '\n';
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] " << name << ": " << e.what() << '\n';
            return 1;
        }
    }

    std::cout << "All tests passed (" << passed << "/" << tests.size() << ").\n";
    return 0;
}
