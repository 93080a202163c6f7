#pragma once

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sprig::runtime {

/// Runtime value of every Sprig expression.
using Value = std::int64_t;

/// One scope of variable bindings, optionally nested in a parent scope.
///
/// Lookups walk outward through the parents. Assignment writes to the nearest
/// scope that already binds the name and otherwise creates the binding here,
/// so names introduced in a block vanish with it while updates to outer names
/// persist.
class Environment {
   public:
    Environment() = default;

    /// An empty scope nested in `parent`. `parent` must outlive the result.
    [[nodiscard]] static auto child_of(Environment& parent) -> Environment;

    /// A root scope holding a copy of every binding visible from `scope`,
    /// inner bindings shadowing outer ones.
    [[nodiscard]] static auto snapshot_of(const Environment& scope) -> Environment;

    [[nodiscard]] auto lookup(const std::string& name) const -> std::optional<Value>;

    /// Write through to an existing binding, or bind in this scope.
    void assign(const std::string& name, Value value);

    /// Bind in this scope, shadowing any outer binding.
    void define(const std::string& name, Value value);

    /// True when `name` is bound in this scope or any parent.
    [[nodiscard]] auto contains(const std::string& name) const -> bool;

    /// Number of bindings local to this scope.
    [[nodiscard]] auto size() const noexcept -> std::size_t { return bindings_.size(); }

    [[nodiscard]] auto parent() const noexcept -> const Environment* { return parent_; }

   private:
    auto find_owner(const std::string& name) -> Environment*;

    robin_hood::unordered_map<std::string, Value> bindings_;
    Environment* parent_ = nullptr;
};

}  // namespace sprig::runtime
