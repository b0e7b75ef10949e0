#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scheep/env.hpp"
#include "scheep/value.hpp"

namespace scheep {

// Pattern variable -> matched sub-forms, in match order. A plain variable
// holds one form; an ellipsis variable holds one form per repetition.
using match_bindings = std::unordered_map<std::string, std::vector<value>>;

enum class pattern_node_kind {
    empty,
    variable,
    literal,
    ellipsis,
    sublist,
    datum
};

// Kind of the first element of a pattern list (empty when the list is
// exhausted). Raises malformed_syntax for a misplaced "..." or a dotted
// pattern.
[[nodiscard]] pattern_node_kind classify_pattern(value pattern, const std::vector<std::string>& literals);

// Matches a pattern list against a form list. Literal identifiers match only
// a symbol with the same binding in use_env as the literal has in def_env:
// the innermost frame holding the name must be the same frame, so equal
// values bound in different frames do not count, and a name unbound in both
// environments does. No match is std::nullopt, not an error.
[[nodiscard]] std::optional<match_bindings> match_pattern(value pattern,
                                                          value form,
                                                          const std::vector<std::string>& literals,
                                                          env_ptr def_env,
                                                          env_ptr use_env);

// Concatenates sequences stored under the same key, lhs entries first.
[[nodiscard]] match_bindings merge_bindings(match_bindings lhs, const match_bindings& rhs);

// Non-literal symbols of a pattern, depth first, "..." excluded.
[[nodiscard]] std::vector<std::string> pattern_variables(value pattern, const std::vector<std::string>& literals);

}  // namespace scheep
