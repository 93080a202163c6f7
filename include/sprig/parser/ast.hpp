#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sprig::parser {

/// A variable or function name. Compared and hashed by name.
struct Identifier {
    std::string name;

    friend auto operator==(const Identifier&, const Identifier&) -> bool = default;
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Eq,
    Ne,
    Lt,
    Gt,
    Le,
    Ge,
};

/// Source spelling of an operator, e.g. "<=".
[[nodiscard]] auto to_string(BinaryOp op) -> const char*;

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct NumberLiteral {
    std::int64_t value = 0;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
};

struct Expr {
    /// Frees operator chains with a worklist, so a long sum does not recurse per term.
    ~Expr();

    std::variant<NumberLiteral, Identifier, BinaryExpr, CallExpr> node;
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;

struct Block {
    std::vector<StmtPtr> statements;
};

struct VarSetStmt {
    Identifier name;
    ExprPtr rhs;
};

struct ReturnStmt {
    ExprPtr expr;
};

struct ExprStmt {
    ExprPtr expr;
};

/// `else_block` is empty when the source has no `else`.
struct IfStmt {
    ExprPtr condition;
    Block then_block;
    Block else_block;
};

struct WhileStmt {
    ExprPtr condition;
    Block block;
};

struct Stmt {
    std::variant<VarSetStmt, ReturnStmt, ExprStmt, Block, IfStmt, WhileStmt> node;
};

struct FunctionDecl {
    Identifier name;
    std::vector<Identifier> params;
    Block body;
};

struct Program {
    std::vector<FunctionDecl> functions;
};

// ─── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto make_number(std::int64_t value) -> ExprPtr;
[[nodiscard]] auto make_identifier(std::string name) -> ExprPtr;
[[nodiscard]] auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;
[[nodiscard]] auto make_call(ExprPtr callee, std::vector<ExprPtr> args) -> ExprPtr;

/// Render an expression with full parenthesization, e.g. "((-1 * 2) + x)".
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

}  // namespace sprig::parser

template <>
struct std::hash<sprig::parser::Identifier> {
    auto operator()(const sprig::parser::Identifier& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.name);
    }
};
