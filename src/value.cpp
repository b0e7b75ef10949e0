#include "scheep/value.hpp"

#include <mutex>
#include <utility>

#include "scheep/env.hpp"
#include "scheep/error.hpp"

namespace scheep {
namespace {

value allocate_value(value_type type) {
    return default_gc().allocate<object>(type);
}

bool has_type(value v, value_type type) {
    return v != nullptr && v->type == type;
}

const object& checked(value v, value_type expected, const char* accessor) {
    if (!has_type(v, expected)) {
        throw type_error(std::string(accessor) + ": expected " + std::string(type_name(expected)) + ", got " +
                         (v ? std::string(type_name(v->type)) : std::string("null")));
    }
    return *v;
}

struct singletons {
    value empty_list;
    value true_value;
    value false_value;
};

const singletons& permanent() {
    static const singletons values = [] {
        singletons out{allocate_value(value_type::nil),
                       allocate_value(value_type::boolean),
                       allocate_value(value_type::boolean)};
        out.true_value->truth = true;
        return out;
    }();
    return values;
}

// One symbol object per name, so eq? on symbols is pointer identity.
class symbol_table {
public:
    value intern(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = symbols_.try_emplace(name, nullptr);
        if (inserted) {
            it->second = allocate_value(value_type::symbol);
            it->second->text = name;
        }
        return it->second;
    }

    void mark_all(gc& heap) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, sym] : symbols_) {
            heap.mark(sym);
        }
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, value> symbols_;
};

symbol_table& symbols() {
    static symbol_table table;
    return table;
}

}  // namespace

void object::trace(gc& heap) {
    if (type == value_type::cons) {
        heap.mark(head);
        heap.mark(tail);
        return;
    }
    if (type == value_type::closure && compound) {
        for (value expr : compound->body) {
            heap.mark(expr);
        }
        heap.mark(compound->scope);
    }
}

value make_nil() {
    return permanent().empty_list;
}

value make_boolean(bool v) {
    return v ? permanent().true_value : permanent().false_value;
}

value make_integer(std::int64_t v) {
    value out = allocate_value(value_type::integer);
    out->exact = v;
    return out;
}

value make_float(double v) {
    value out = allocate_value(value_type::floating);
    out->inexact = v;
    return out;
}

value make_symbol(const std::string& name) {
    if (name.empty()) {
        throw lisp_error("make_symbol: empty name");
    }
    return symbols().intern(name);
}

value make_string(const std::string& text) {
    value out = allocate_value(value_type::string);
    out->text = text;
    return out;
}

value make_cons(value car_value, value cdr_value) {
    value out = allocate_value(value_type::cons);
    out->head = car_value;
    out->tail = cdr_value;
    return out;
}

value make_primitive(const std::string& name, primitive_fn fn) {
    value out = allocate_value(value_type::primitive_fn);
    out->primitive = std::make_unique<primitive_procedure>(primitive_procedure{name, std::move(fn)});
    return out;
}

value make_closure(const std::vector<std::string>& params, const std::vector<value>& body, env_ptr captured_env) {
    value out = allocate_value(value_type::closure);
    out->compound = std::make_unique<compound_procedure>(compound_procedure{params, body, captured_env});
    return out;
}

value_type type_of(value v) {
    if (!v) {
        throw lisp_error("type_of: null value");
    }
    return v->type;
}

std::string_view type_name(value_type t) {
    switch (t) {
        case value_type::nil:
            return "empty list";
        case value_type::boolean:
            return "boolean";
        case value_type::integer:
            return "integer";
        case value_type::floating:
            return "float";
        case value_type::symbol:
            return "symbol";
        case value_type::string:
            return "string";
        case value_type::cons:
            return "pair";
        case value_type::primitive_fn:
            return "primitive procedure";
        case value_type::closure:
            return "compound procedure";
    }
    return "unknown";
}

bool is_nil(value v) {
    return has_type(v, value_type::nil);
}

bool is_boolean(value v) {
    return has_type(v, value_type::boolean);
}

bool is_integer(value v) {
    return has_type(v, value_type::integer);
}

bool is_float(value v) {
    return has_type(v, value_type::floating);
}

bool is_symbol(value v) {
    return has_type(v, value_type::symbol);
}

bool is_string(value v) {
    return has_type(v, value_type::string);
}

bool is_cons(value v) {
    return has_type(v, value_type::cons);
}

// Numbers, strings and booleans. The empty list is not: `()` is an
// application with no operator.
bool is_self_evaluating(value v) {
    if (!v) {
        return false;
    }
    switch (v->type) {
        case value_type::boolean:
        case value_type::integer:
        case value_type::floating:
        case value_type::string:
            return true;
        case value_type::nil:
        case value_type::symbol:
        case value_type::cons:
        case value_type::primitive_fn:
        case value_type::closure:
            return false;
    }
    return false;
}

bool is_truthy(value v) {
    return v != make_boolean(false);
}

bool is_symbol_named(value v, std::string_view name) {
    return is_symbol(v) && v->text == name;
}

bool boolean_value(value v) {
    return checked(v, value_type::boolean, "boolean_value").truth;
}

std::int64_t integer_value(value v) {
    return checked(v, value_type::integer, "integer_value").exact;
}

double float_value(value v) {
    return checked(v, value_type::floating, "float_value").inexact;
}

const std::string& symbol_name(value v) {
    return checked(v, value_type::symbol, "symbol_name").text;
}

const std::string& string_value(value v) {
    return checked(v, value_type::string, "string_value").text;
}

value car(value v) {
    return checked(v, value_type::cons, "car").head;
}

value cdr(value v) {
    return checked(v, value_type::cons, "cdr").tail;
}

const primitive_procedure& primitive_of(value v) {
    return *checked(v, value_type::primitive_fn, "primitive_of").primitive;
}

const compound_procedure& compound_of(value v) {
    return *checked(v, value_type::closure, "compound_of").compound;
}

value list_from_vector(const std::vector<value>& items) {
    value list = make_nil();
    for (std::size_t i = items.size(); i > 0; --i) {
        list = make_cons(items[i - 1], list);
    }
    return list;
}

std::vector<value> vector_from_list(value list_value) {
    std::vector<value> items;
    for (value cell = list_value; !is_nil(cell); cell = cell->tail) {
        if (!is_cons(cell)) {
            throw type_error("expected proper list");
        }
        items.push_back(cell->head);
    }
    return items;
}

bool is_proper_list(value list_value) {
    value cell = list_value;
    while (is_cons(cell)) {
        cell = cell->tail;
    }
    return is_nil(cell);
}

// Identity, except that numbers compare by value within the same exactness.
bool eq_values(value lhs, value rhs) {
    if (lhs == rhs) {
        return true;
    }
    if (!lhs || !rhs || lhs->type != rhs->type) {
        return false;
    }
    switch (lhs->type) {
        case value_type::integer:
            return lhs->exact == rhs->exact;
        case value_type::floating:
            return lhs->inexact == rhs->inexact;
        case value_type::nil:
        case value_type::boolean:
        case value_type::symbol:
        case value_type::string:
        case value_type::cons:
        case value_type::primitive_fn:
        case value_type::closure:
            return false;
    }
    return false;
}

void mark_permanent_values(gc& heap) {
    const singletons& values = permanent();
    heap.mark(values.empty_list);
    heap.mark(values.true_value);
    heap.mark(values.false_value);
    symbols().mark_all(heap);
}

}  // namespace scheep
