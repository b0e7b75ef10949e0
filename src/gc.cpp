#include "scheep/gc.hpp"

#include <algorithm>

#include "scheep/env.hpp"
#include "scheep/value.hpp"

namespace scheep {
namespace {

constexpr std::size_t minimum_threshold = 256;

}  // namespace

gc::~gc() {
    for (gc_node* node : nodes_) {
        delete node;
    }
}

void gc::maybe_collect() {
    if (nodes_.size() > threshold_) {
        collect();
    }
}

void gc::collect() {
    for (value* slot : root_slots_) {
        mark(*slot);
    }
    for (const auto& [pinned, _] : pinned_envs_) {
        mark(pinned);
    }
    mark_permanent_values(*this);

    drain_pending();
    sweep();
    ++collections_;
}

// Marking only queues the node; drain_pending() traces it. Long cdr chains
// therefore cost heap space rather than host stack.
void gc::mark(gc_node* node) {
    if (!node || node->marked) {
        return;
    }
    node->marked = true;
    pending_.push_back(node);
}

void gc::drain_pending() {
    while (!pending_.empty()) {
        gc_node* node = pending_.back();
        pending_.pop_back();
        node->trace(*this);
    }
}

void gc::sweep() {
    std::size_t kept = 0;
    for (gc_node* node : nodes_) {
        if (!node->marked) {
            delete node;
            continue;
        }
        node->marked = false;
        nodes_[kept++] = node;
    }
    nodes_.resize(kept);

    live_after_last_gc_ = kept;
    threshold_ = std::max(minimum_threshold, kept * 2);
}

void gc::register_root_env(env_ptr e) {
    if (e && pinned_envs_.find(e) == pinned_envs_.end()) {
        pin_env(e);
    }
}

void gc::pin_env(env_ptr e) {
    ++pinned_envs_[e];
}

void gc::unpin_env(env_ptr e) {
    const auto it = pinned_envs_.find(e);
    if (it == pinned_envs_.end()) {
        return;
    }
    if (--it->second == 0) {
        pinned_envs_.erase(it);
    }
}

gc_stats_snapshot gc::stats() const noexcept {
    gc_stats_snapshot snapshot;
    snapshot.total_allocated_objects = total_allocated_;
    snapshot.live_objects_after_last_gc = live_after_last_gc_;
    snapshot.collections = collections_;
    snapshot.next_gc_threshold = threshold_;
    return snapshot;
}

gc& default_gc() {
    static gc heap;
    return heap;
}

gc_root_scope::gc_root_scope(gc& heap) : heap_(heap), first_slot_(heap.root_slots_.size()) {}

gc_root_scope::~gc_root_scope() {
    heap_.root_slots_.resize(first_slot_);
}

void gc_root_scope::add(value* slot) {
    if (slot) {
        heap_.root_slots_.push_back(slot);
    }
}

scoped_env_root::scoped_env_root(gc& heap, env_ptr e) : heap_(heap), env_(e) {
    if (env_) {
        heap_.pin_env(env_);
    }
}

scoped_env_root::~scoped_env_root() {
    if (env_) {
        heap_.unpin_env(env_);
    }
}

}  // namespace scheep
