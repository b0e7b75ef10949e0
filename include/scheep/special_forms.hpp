#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scheep/value.hpp"

namespace scheep {

// Receives the whole unevaluated form, head symbol included.
using special_form_handler = std::function<value(value expr, env_ptr scope)>;

// Tag -> handler table consulted by eval. Handlers are registered at startup;
// once sealed the table is read-only, so lookups take no lock.
class special_form_registry {
public:
    void register_form(const std::string& tag, special_form_handler handler);
    [[nodiscard]] const special_form_handler* find(const std::string& tag) const;
    [[nodiscard]] bool contains(const std::string& tag) const;

    void seal();
    [[nodiscard]] bool sealed() const noexcept { return sealed_; }
    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }
    [[nodiscard]] std::vector<std::string> tags() const;

private:
    std::unordered_map<std::string, special_form_handler> handlers_;
    bool sealed_ = false;
};

// quote, set!, define, if, lambda, begin.
void install_core_special_forms(special_form_registry& registry);

// Registry used by eval; core forms are installed on first use.
special_form_registry& default_special_forms();
void register_special_form(const std::string& tag, special_form_handler handler);

// Arguments of a special form, i.e. everything after the head symbol.
[[nodiscard]] std::vector<value> form_arguments(value expr, const std::string& form_name);

}  // namespace scheep
