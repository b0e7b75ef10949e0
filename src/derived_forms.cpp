#include "scheep/derived_forms.hpp"

#include "scheep/error.hpp"
#include "scheep/special_forms.hpp"

namespace scheep {
namespace {

value make_if(value predicate, value consequent, value alternative) {
    return list_from_vector({make_symbol("if"), predicate, consequent, alternative});
}

bool is_else_clause(const std::vector<value>& clause) {
    return is_symbol_named(clause.front(), "else");
}

std::vector<value> clause_items(value clause_expr) {
    if (!is_cons(clause_expr) || !is_proper_list(clause_expr)) {
        throw malformed_syntax("cond", "each clause must be a non-empty list");
    }
    return vector_from_list(clause_expr);
}

value expand_clauses(const std::vector<value>& clauses, std::size_t index) {
    if (index == clauses.size()) {
        return make_boolean(false);
    }

    const std::vector<value> clause = clause_items(clauses[index]);
    const std::vector<value> actions(clause.begin() + 1, clause.end());

    if (is_else_clause(clause)) {
        if (index + 1 != clauses.size()) {
            throw malformed_syntax("cond", "else clause must be the last clause");
        }
        return sequence_to_expression(actions);
    }

    return make_if(clause.front(), sequence_to_expression(actions), expand_clauses(clauses, index + 1));
}

}  // namespace

bool is_derived_form(value expr) {
    return is_cons(expr) && is_symbol_named(car(expr), "cond");
}

value expand_derived_form(value expr) {
    if (is_symbol_named(car(expr), "cond")) {
        return expand_cond(expr);
    }
    throw malformed_syntax("derived form", "no rewrite for this form");
}

value expand_cond(value expr) {
    const std::vector<value> clauses = form_arguments(expr, "cond");
    return expand_clauses(clauses, 0);
}

value sequence_to_expression(const std::vector<value>& actions) {
    if (actions.empty()) {
        return make_nil();
    }
    if (actions.size() == 1) {
        return actions.front();
    }

    std::vector<value> wrapped;
    wrapped.reserve(actions.size() + 1);
    wrapped.push_back(make_symbol("begin"));
    wrapped.insert(wrapped.end(), actions.begin(), actions.end());
    return list_from_vector(wrapped);
}

}  // namespace scheep
