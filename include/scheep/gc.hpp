#pragma once

#include <cstddef>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scheep {

struct object;
struct frame;
struct env;

using value = object*;
using frame_ptr = frame*;
using env_ptr = env*;

class gc;

// Anything the collector owns: values, binding frames and environment links.
struct gc_node {
    virtual ~gc_node() = default;

    // Hands every node this one keeps alive to heap.mark().
    virtual void trace(gc& heap) = 0;

    bool marked = false;
};

struct gc_stats_snapshot {
    std::size_t total_allocated_objects = 0;
    std::size_t live_objects_after_last_gc = 0;
    std::size_t collections = 0;
    std::size_t next_gc_threshold = 0;
};

// Mark-and-sweep heap. Nothing is reclaimed behind the evaluator's back:
// collection runs from maybe_collect() between top-level forms, or from an
// explicit collect().
class gc {
public:
    gc() = default;
    ~gc();

    gc(const gc&) = delete;
    gc& operator=(const gc&) = delete;

    template <typename T, typename... Args>
    T* allocate(Args&&... args) {
        static_assert(std::is_base_of_v<gc_node, T>, "gc owns only gc_node types");
        T* node = new T(std::forward<Args>(args)...);
        nodes_.push_back(node);
        ++total_allocated_;
        return node;
    }

    void maybe_collect();
    void collect();

    void mark(gc_node* node);

    // Pins an environment for the lifetime of the heap (the global scope).
    void register_root_env(env_ptr e);

    [[nodiscard]] std::size_t live_nodes() const noexcept { return nodes_.size(); }
    [[nodiscard]] gc_stats_snapshot stats() const noexcept;

private:
    void pin_env(env_ptr e);
    void unpin_env(env_ptr e);
    void drain_pending();
    void sweep();

    std::vector<gc_node*> nodes_;
    std::vector<gc_node*> pending_;
    std::vector<value*> root_slots_;
    std::unordered_map<env_ptr, std::size_t> pinned_envs_;

    std::size_t total_allocated_ = 0;
    std::size_t live_after_last_gc_ = 0;
    std::size_t collections_ = 0;
    std::size_t threshold_ = 256;

    friend class gc_root_scope;
    friend class scoped_env_root;
};

gc& default_gc();

// Value slots that must survive any collection while this scope is open.
// Scopes nest; closing one drops exactly the slots it added.
class gc_root_scope {
public:
    explicit gc_root_scope(gc& heap);
    ~gc_root_scope();

    gc_root_scope(const gc_root_scope&) = delete;
    gc_root_scope& operator=(const gc_root_scope&) = delete;

    void add(value* slot);

private:
    gc& heap_;
    std::size_t first_slot_ = 0;
};

// Keeps a call scope, and everything reachable from it, alive while a body runs.
class scoped_env_root {
public:
    scoped_env_root(gc& heap, env_ptr e);
    ~scoped_env_root();

    scoped_env_root(const scoped_env_root&) = delete;
    scoped_env_root& operator=(const scoped_env_root&) = delete;

private:
    gc& heap_;
    env_ptr env_ = nullptr;
};

}  // namespace scheep
