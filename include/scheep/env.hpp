#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scheep/gc.hpp"

namespace scheep {

// One scope level. Every insert or overwrite holds the frame's mutex, so a
// reader of the same frame never sees a partially applied update.
struct frame final : gc_node {
    frame() = default;
    frame(const std::vector<std::string>& names, const std::vector<value>& values);

    [[nodiscard]] std::optional<value> get(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    void put(const std::string& name, value bound_value);
    [[nodiscard]] bool replace(const std::string& name, value bound_value);
    [[nodiscard]] std::size_t size() const;

    void trace(gc& heap) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, value> bindings_;
};

// A chain link: the innermost frame plus the enclosing environment. The empty
// environment is the null env_ptr.
struct env final : gc_node {
    env(frame_ptr first, env_ptr enclosing_env);

    frame_ptr first_frame = nullptr;
    env_ptr enclosing = nullptr;

    void trace(gc& heap) override;
};

[[nodiscard]] constexpr env_ptr the_empty_environment() noexcept {
    return nullptr;
}

[[nodiscard]] bool is_empty_environment(env_ptr scope) noexcept;

env_ptr make_env(env_ptr enclosing = the_empty_environment());
env_ptr extend_environment(env_ptr enclosing, const std::vector<std::string>& names, const std::vector<value>& values);

void define(env_ptr scope, const std::string& name, value bound_value);
void assign(env_ptr scope, const std::string& name, value bound_value);
value lookup(env_ptr scope, const std::string& name);
[[nodiscard]] frame_ptr find_binding_frame(env_ptr scope, const std::string& name);

}  // namespace scheep
