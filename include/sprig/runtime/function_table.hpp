#pragma once

#include <sprig/parser/ast.hpp>

#include <robin_hood.h>

#include <cstddef>

namespace sprig::runtime {

/// Function declarations by name.
///
/// Entries point into a caller-owned Program, which must outlive the table.
/// Registering a name twice keeps the later declaration.
class FunctionTable {
   public:
    FunctionTable() = default;

    /// Register every declaration of `program` in order.
    [[nodiscard]] static auto from_program(const parser::Program& program) -> FunctionTable;

    /// Register a declaration. Returns true when it replaced an earlier one.
    auto register_function(const parser::FunctionDecl& decl) -> bool {
        return !functions_.insert_or_assign(decl.name, &decl).second;
    }

    /// Look up a registered function by name.
    [[nodiscard]] auto find(const parser::Identifier& name) const -> const parser::FunctionDecl* {
        if (auto it = functions_.find(name); it != functions_.end()) {
            return it->second;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const parser::Identifier& name) const -> bool {
        return find(name) != nullptr;
    }

    /// Number of registered functions.
    [[nodiscard]] auto size() const noexcept -> std::size_t { return functions_.size(); }

   private:
    robin_hood::unordered_map<parser::Identifier, const parser::FunctionDecl*> functions_;
};

}  // namespace sprig::runtime
