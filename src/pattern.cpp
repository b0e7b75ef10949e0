#include "scheep/pattern.hpp"

#include <algorithm>
#include <utility>

#include "scheep/error.hpp"

namespace scheep {
namespace {

constexpr const char* k_ellipsis = "...";

struct match_context {
    const std::vector<std::string>& literals;
    env_ptr def_env;
    env_ptr use_env;
};

bool is_literal(const std::vector<std::string>& literals, const std::string& name) {
    return std::find(literals.begin(), literals.end(), name) != literals.end();
}

bool followed_by_ellipsis(value pattern) {
    value rest = cdr(pattern);
    return is_cons(rest) && is_symbol_named(car(rest), k_ellipsis);
}

bool same_binding(const std::string& pattern_name, const match_context& ctx, value form_item) {
    if (!is_symbol(form_item) || symbol_name(form_item) != pattern_name) {
        return false;
    }
    return find_binding_frame(ctx.def_env, pattern_name) == find_binding_frame(ctx.use_env, pattern_name);
}

bool same_datum(value pattern_item, value form_item) {
    if (is_string(pattern_item) && is_string(form_item)) {
        return string_value(pattern_item) == string_value(form_item);
    }
    return eq_values(pattern_item, form_item);
}

void collect_variables(value pattern, const std::vector<std::string>& literals, std::vector<std::string>& out) {
    if (is_symbol(pattern)) {
        const std::string& name = symbol_name(pattern);
        if (name != k_ellipsis && !is_literal(literals, name) && std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
        return;
    }
    for (value cursor = pattern; is_cons(cursor); cursor = cdr(cursor)) {
        collect_variables(car(cursor), literals, out);
    }
}

std::optional<match_bindings> match_list(value pattern, value form, const match_context& ctx, match_bindings acc);

std::optional<match_bindings> match_ellipsis(value sub_pattern, value form, const match_context& ctx, match_bindings acc) {
    if (!is_proper_list(form)) {
        return std::nullopt;
    }

    match_bindings repeated;
    for (const std::string& name : pattern_variables(list_from_vector({sub_pattern}), ctx.literals)) {
        repeated[name];
    }

    value single_pattern = list_from_vector({sub_pattern});
    for (value cursor = form; is_cons(cursor); cursor = cdr(cursor)) {
        auto one = match_list(single_pattern, list_from_vector({car(cursor)}), ctx, {});
        if (!one) {
            return std::nullopt;
        }
        repeated = merge_bindings(std::move(repeated), *one);
    }
    return merge_bindings(std::move(acc), repeated);
}

std::optional<match_bindings> match_list(value pattern, value form, const match_context& ctx, match_bindings acc) {
    while (true) {
        const pattern_node_kind kind = classify_pattern(pattern, ctx.literals);
        if (kind == pattern_node_kind::ellipsis) {
            return match_ellipsis(car(pattern), form, ctx, std::move(acc));
        }
        if (kind == pattern_node_kind::empty) {
            if (is_nil(form)) {
                return acc;
            }
            return std::nullopt;
        }
        if (!is_cons(form)) {
            return std::nullopt;
        }

        value pattern_item = car(pattern);
        value form_item = car(form);
        switch (kind) {
            case pattern_node_kind::variable:
                acc = merge_bindings(std::move(acc), match_bindings{{symbol_name(pattern_item), {form_item}}});
                break;
            case pattern_node_kind::literal:
                if (!same_binding(symbol_name(pattern_item), ctx, form_item)) {
                    return std::nullopt;
                }
                break;
            case pattern_node_kind::sublist: {
                if (!is_nil(form_item) && !is_cons(form_item)) {
                    return std::nullopt;
                }
                auto nested = match_list(pattern_item, form_item, ctx, {});
                if (!nested) {
                    return std::nullopt;
                }
                acc = merge_bindings(std::move(acc), *nested);
                break;
            }
            case pattern_node_kind::datum:
                if (!same_datum(pattern_item, form_item)) {
                    return std::nullopt;
                }
                break;
            case pattern_node_kind::empty:
            case pattern_node_kind::ellipsis:
                break;
        }

        pattern = cdr(pattern);
        form = cdr(form);
    }
}

}  // namespace

pattern_node_kind classify_pattern(value pattern, const std::vector<std::string>& literals) {
    if (is_nil(pattern)) {
        return pattern_node_kind::empty;
    }
    if (!is_cons(pattern)) {
        throw malformed_syntax("pattern", "dotted patterns are not supported");
    }

    value head = car(pattern);
    if (is_symbol_named(head, k_ellipsis)) {
        throw malformed_syntax("pattern", "... must follow a sub-pattern");
    }
    if (followed_by_ellipsis(pattern)) {
        if (!is_nil(cdr(cdr(pattern)))) {
            throw malformed_syntax("pattern", "... must be the last element of a pattern list");
        }
        return pattern_node_kind::ellipsis;
    }
    if (is_symbol(head)) {
        return is_literal(literals, symbol_name(head)) ? pattern_node_kind::literal : pattern_node_kind::variable;
    }
    if (is_cons(head) || is_nil(head)) {
        return pattern_node_kind::sublist;
    }
    return pattern_node_kind::datum;
}

std::optional<match_bindings> match_pattern(value pattern,
                                            value form,
                                            const std::vector<std::string>& literals,
                                            env_ptr def_env,
                                            env_ptr use_env) {
    const match_context ctx{literals, def_env, use_env};
    return match_list(pattern, form, ctx, {});
}

match_bindings merge_bindings(match_bindings lhs, const match_bindings& rhs) {
    for (const auto& [name, forms] : rhs) {
        auto& target = lhs[name];
        target.insert(target.end(), forms.begin(), forms.end());
    }
    return lhs;
}

std::vector<std::string> pattern_variables(value pattern, const std::vector<std::string>& literals) {
    std::vector<std::string> out;
    collect_variables(pattern, literals, out);
    return out;
}

}  // namespace scheep
