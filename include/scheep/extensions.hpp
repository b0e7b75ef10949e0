#pragma once

#include <string>

#include "scheep/env.hpp"
#include "scheep/value.hpp"

namespace scheep {

class special_form_registry;

// Adds host primitives and values to the global frame; refuses to shadow an
// existing global.
class registrar {
public:
    explicit registrar(env_ptr global_env);

    void register_builtin(const std::string& name, primitive_fn fn);
    void register_value(const std::string& name, value bound_value);

private:
    void claim(const std::string& name) const;

    env_ptr global_env_;
};

using extension_register_hook_fn = void (*)(registrar* r, void* user);
using special_form_hook_fn = void (*)(special_form_registry* registry, void* user);

struct runtime_config {
    extension_register_hook_fn extension_register_hook = nullptr;
    void* extension_register_user = nullptr;
    special_form_hook_fn special_form_hook = nullptr;
    void* special_form_user = nullptr;
    bool seal_special_forms = false;
};

}  // namespace scheep
