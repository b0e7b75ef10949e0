#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "scheep/gc.hpp"

namespace scheep {

using primitive_fn = std::function<value(const std::vector<value>&)>;
using primitive_table = std::unordered_map<std::string, primitive_fn>;

enum class value_type {
    nil,
    boolean,
    integer,
    floating,
    symbol,
    string,
    cons,
    primitive_fn,
    closure
};

// A host function installed under a name, usually in the global frame.
struct primitive_procedure {
    std::string name;
    primitive_fn fn;
};

// What lambda produces: parameters, body and the scope it was evaluated in.
struct compound_procedure {
    std::vector<std::string> params;
    std::vector<value> body;
    env_ptr scope = nullptr;
};

// Expressions and runtime values share this one representation; the reader's
// output is evaluated as-is. Only the fields for `type` are meaningful.
struct object final : gc_node {
    explicit object(value_type tag) : type(tag) {}

    const value_type type;
    bool truth = false;
    std::int64_t exact = 0;
    double inexact = 0.0;
    std::string text;  // symbol name or string contents
    value head = nullptr;
    value tail = nullptr;
    std::unique_ptr<primitive_procedure> primitive;
    std::unique_ptr<compound_procedure> compound;

    void trace(gc& heap) override;
};

// `()`, `#t` and `#f` are singletons; symbols are interned by name.
value make_nil();
value make_boolean(bool v);
value make_integer(std::int64_t v);
value make_float(double v);
value make_symbol(const std::string& name);
value make_string(const std::string& text);
value make_cons(value car_value, value cdr_value);
value make_primitive(const std::string& name, primitive_fn fn);
value make_closure(const std::vector<std::string>& params, const std::vector<value>& body, env_ptr captured_env);

[[nodiscard]] value_type type_of(value v);
[[nodiscard]] std::string_view type_name(value_type t);

[[nodiscard]] bool is_nil(value v);
[[nodiscard]] bool is_boolean(value v);
[[nodiscard]] bool is_integer(value v);
[[nodiscard]] bool is_float(value v);
[[nodiscard]] bool is_symbol(value v);
[[nodiscard]] bool is_string(value v);
[[nodiscard]] bool is_cons(value v);
[[nodiscard]] bool is_self_evaluating(value v);
[[nodiscard]] bool is_truthy(value v);
[[nodiscard]] bool is_symbol_named(value v, std::string_view name);

// Accessors throw type_error when `v` has another type.
[[nodiscard]] bool boolean_value(value v);
[[nodiscard]] std::int64_t integer_value(value v);
[[nodiscard]] double float_value(value v);
[[nodiscard]] const std::string& symbol_name(value v);
[[nodiscard]] const std::string& string_value(value v);
[[nodiscard]] value car(value v);
[[nodiscard]] value cdr(value v);
[[nodiscard]] const primitive_procedure& primitive_of(value v);
[[nodiscard]] const compound_procedure& compound_of(value v);

[[nodiscard]] value list_from_vector(const std::vector<value>& items);
[[nodiscard]] std::vector<value> vector_from_list(value list_value);
[[nodiscard]] bool is_proper_list(value list_value);
[[nodiscard]] bool eq_values(value lhs, value rhs);

// Marks the singletons and every interned symbol; called by each collection.
void mark_permanent_values(gc& heap);

}  // namespace scheep
