#pragma once

#include <functional>
#include <string_view>
#include <vector>

#include "scheep/builtins.hpp"
#include "scheep/env.hpp"
#include "scheep/extensions.hpp"

namespace scheep {

value eval(value expr, env_ptr scope);
value eval_sequence(const std::vector<value>& exprs, env_ptr scope);
value apply_procedure(value procedure, const std::vector<value>& args);
// Called with the value of each top-level form, in order.
using result_observer = std::function<void(value)>;

// Reads every form in `source` and evaluates them in `scope`, returning the
// last value. A parse error is raised before anything is evaluated.
value eval_source(std::string_view source, env_ptr scope, const result_observer& on_result = {});

env_ptr make_global_environment(const primitive_table& primitives);
env_ptr create_global_env();
env_ptr create_global_env(const runtime_config& config);

}  // namespace scheep
