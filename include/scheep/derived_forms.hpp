#pragma once

#include "scheep/value.hpp"

namespace scheep {

[[nodiscard]] bool is_derived_form(value expr);
[[nodiscard]] value expand_derived_form(value expr);

// (cond clause...) -> nested (if predicate actions rest). Raises
// malformed_syntax for a non-final else clause before anything is evaluated.
[[nodiscard]] value expand_cond(value expr);

// () for no actions, the action itself for one, (begin actions...) otherwise.
[[nodiscard]] value sequence_to_expression(const std::vector<value>& actions);

}  // namespace scheep
