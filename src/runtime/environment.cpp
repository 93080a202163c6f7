#include <sprig/runtime/environment.hpp>

#include <vector>

namespace sprig::runtime {

auto Environment::child_of(Environment& parent) -> Environment {
    Environment scope;
    scope.parent_ = &parent;
    return scope;
}

auto Environment::snapshot_of(const Environment& scope) -> Environment {
    std::vector<const Environment*> chain;
    for (const auto* current = &scope; current != nullptr; current = current->parent_) {
        chain.push_back(current);
    }
    Environment snapshot;
    // Outermost first so inner bindings overwrite the names they shadow.
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        for (const auto& [name, value] : (*it)->bindings_) {
            snapshot.bindings_.insert_or_assign(name, value);
        }
    }
    return snapshot;
}

auto Environment::lookup(const std::string& name) const -> std::optional<Value> {
    for (const auto* current = this; current != nullptr; current = current->parent_) {
        if (auto it = current->bindings_.find(name); it != current->bindings_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

void Environment::assign(const std::string& name, Value value) {
    if (auto* owner = find_owner(name); owner != nullptr) {
        owner->bindings_[name] = value;
        return;
    }
    bindings_.insert_or_assign(name, value);
}

void Environment::define(const std::string& name, Value value) {
    bindings_.insert_or_assign(name, value);
}

auto Environment::contains(const std::string& name) const -> bool {
    return lookup(name).has_value();
}

auto Environment::find_owner(const std::string& name) -> Environment* {
    for (auto* current = this; current != nullptr; current = current->parent_) {
        if (current->bindings_.find(name) != current->bindings_.end()) {
            return current;
        }
    }
    return nullptr;
}

}  // namespace sprig::runtime
