#include "scheep/extensions.hpp"

#include <utility>

#include "scheep/error.hpp"

namespace scheep {

registrar::registrar(env_ptr global_env) : global_env_(global_env) {
    if (is_empty_environment(global_env_)) {
        throw lisp_error("registrar: cannot register into the empty environment");
    }
}

void registrar::register_builtin(const std::string& name, primitive_fn fn) {
    if (!fn) {
        throw lisp_error("registrar: primitive " + name + " has no function");
    }
    claim(name);
    define(global_env_, name, make_primitive(name, std::move(fn)));
}

void registrar::register_value(const std::string& name, value bound_value) {
    if (!bound_value) {
        throw lisp_error("registrar: value for " + name + " is null");
    }
    claim(name);
    define(global_env_, name, bound_value);
}

// Extensions add globals; they never replace one.
void registrar::claim(const std::string& name) const {
    if (name.empty()) {
        throw lisp_error("registrar: empty name");
    }
    if (global_env_->first_frame->contains(name)) {
        throw lisp_error("registrar: " + name + " is already bound");
    }
}

}  // namespace scheep
