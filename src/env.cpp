#include "scheep/env.hpp"

#include "scheep/error.hpp"
#include "scheep/value.hpp"

namespace scheep {

frame::frame(const std::vector<std::string>& names, const std::vector<value>& values) {
    if (names.size() != values.size()) {
        throw arity_mismatch("frame", names.size(), values.size());
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        bindings_[names[i]] = values[i];
    }
}

std::optional<value> frame::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool frame::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.find(name) != bindings_.end();
}

void frame::put(const std::string& name, value bound_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_[name] = bound_value;
}

bool frame::replace(const std::string& name, value bound_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        return false;
    }
    it->second = bound_value;
    return true;
}

std::size_t frame::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

void frame::trace(gc& heap) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, bound] : bindings_) {
        heap.mark(bound);
    }
}

env::env(frame_ptr first, env_ptr enclosing_env) : first_frame(first), enclosing(enclosing_env) {}

void env::trace(gc& heap) {
    heap.mark(first_frame);
    heap.mark(enclosing);
}

bool is_empty_environment(env_ptr scope) noexcept {
    return scope == nullptr;
}

env_ptr make_env(env_ptr enclosing) {
    frame_ptr fresh = default_gc().allocate<frame>();
    return default_gc().allocate<env>(fresh, enclosing);
}

env_ptr extend_environment(env_ptr enclosing, const std::vector<std::string>& names, const std::vector<value>& values) {
    if (names.size() != values.size()) {
        throw arity_mismatch("extend_environment", names.size(), values.size());
    }
    frame_ptr fresh = default_gc().allocate<frame>(names, values);
    return default_gc().allocate<env>(fresh, enclosing);
}

void define(env_ptr scope, const std::string& name, value bound_value) {
    if (is_empty_environment(scope)) {
        throw lisp_error("define: cannot define " + name + " in the empty environment");
    }
    scope->first_frame->put(name, bound_value);
}

void assign(env_ptr scope, const std::string& name, value bound_value) {
    for (env_ptr cursor = scope; !is_empty_environment(cursor); cursor = cursor->enclosing) {
        if (cursor->first_frame->replace(name, bound_value)) {
            return;
        }
    }
    throw unbound_variable(name);
}

value lookup(env_ptr scope, const std::string& name) {
    for (env_ptr cursor = scope; !is_empty_environment(cursor); cursor = cursor->enclosing) {
        if (const auto found = cursor->first_frame->get(name)) {
            return *found;
        }
    }
    throw unbound_variable(name);
}

frame_ptr find_binding_frame(env_ptr scope, const std::string& name) {
    for (env_ptr cursor = scope; !is_empty_environment(cursor); cursor = cursor->enclosing) {
        if (cursor->first_frame->contains(name)) {
            return cursor->first_frame;
        }
    }
    return nullptr;
}

}  // namespace scheep
