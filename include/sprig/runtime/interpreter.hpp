#pragma once

#include <sprig/core/outcome.hpp>
#include <sprig/parser/ast.hpp>
#include <sprig/runtime/environment.hpp>
#include <sprig/runtime/function_table.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sprig::runtime {

enum class EvalErrorKind : std::uint8_t {
    UndefinedVariable,
    UndefinedFunction,
    InvalidCallee,
    UnknownOperator,
    DivisionByZero,
    IntegerOverflow,
    ArityMismatch,
    VoidValue,
    CallDepthExceeded,
    ExpressionTooDeep,
};

[[nodiscard]] auto to_string(EvalErrorKind kind) -> const char*;

/// A fatal evaluation error. Aborts the whole run.
struct EvalError {
    EvalErrorKind kind = EvalErrorKind::UndefinedVariable;
    std::string message;
    /// Innermost Sprig function executing when the error occurred, if any.
    std::string function;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using EvalResult = Outcome<T, EvalError>;

/// Statement finished normally; execution continues with the next one.
struct Completed {};

/// A `return` is unwinding to the enclosing call.
struct Returning {
    Value value = 0;
};

using Completion = std::variant<Completed, Returning>;

struct InterpreterOptions {
    /// Destination of `print`; std::cout when null.
    std::ostream* out = nullptr;
    /// Deepest allowed nesting of Sprig function calls.
    std::size_t max_call_depth = 1000;
    /// Deepest allowed nesting of expression evaluation within one call.
    /// Left-folded operator chains such as `1 + 2 + 3` count as one level.
    std::size_t max_expression_depth = 1000;
};

/// Tree-walking evaluator.
///
/// Blocks run in child scopes of the enclosing scope. A call runs in a fresh
/// root scope seeded with a snapshot of the caller's visible bindings plus
/// the parameters, so callees can read but never modify caller variables.
class Interpreter {
   public:
    explicit Interpreter(InterpreterOptions options = {});

    /// Register the program's functions (later duplicates win), then call `main()`.
    /// Yields `main`'s return value, or nullopt if it finishes without `return`.
    [[nodiscard]] auto run(const parser::Program& program) -> EvalResult<std::optional<Value>>;

    /// Replace the function table with the declarations of `program`.
    void load(const parser::Program& program);

    /// Call a loaded function with already-evaluated arguments.
    [[nodiscard]] auto call(const std::string& name, const std::vector<Value>& args)
        -> EvalResult<std::optional<Value>>;

    [[nodiscard]] auto evaluate(const parser::Expr& expr, Environment& env) -> EvalResult<Value>;
    [[nodiscard]] auto execute(const parser::Stmt& stmt, Environment& env)
        -> EvalResult<Completion>;

    [[nodiscard]] auto functions() const noexcept -> const FunctionTable& { return functions_; }

   private:
    auto evaluate_binary(const parser::BinaryExpr& expr, Environment& env) -> EvalResult<Value>;
    auto execute_block(const parser::Block& block, Environment& parent) -> EvalResult<Completion>;
    auto execute_while(const parser::WhileStmt& loop, Environment& env) -> EvalResult<Completion>;
    auto eval_call(const parser::CallExpr& call, Environment& env)
        -> EvalResult<std::optional<Value>>;
    auto invoke(const parser::FunctionDecl& decl, const std::vector<Value>& args,
                const Environment& caller) -> EvalResult<std::optional<Value>>;
    auto print(Value value) -> void;

    InterpreterOptions options_;
    FunctionTable functions_;
    std::size_t call_depth_ = 0;
    std::size_t expression_depth_ = 0;
};

/// Apply a binary operator. Comparisons yield 1 or 0; division truncates
/// toward zero.
[[nodiscard]] auto apply_binary(parser::BinaryOp op, Value lhs, Value rhs) -> EvalResult<Value>;

/// Run `program` with a fresh interpreter.
[[nodiscard]] auto interpret(const parser::Program& program, const InterpreterOptions& options = {})
    -> EvalResult<std::optional<Value>>;

}  // namespace sprig::runtime
