#include <sprig/runtime/interpreter.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace sprig::runtime {

namespace {

using parser::BinaryOp;

auto fail(EvalErrorKind kind, std::string message) -> std::unexpected<EvalError> {
    return std::unexpected(EvalError{.kind = kind, .message = std::move(message)});
}

auto overflow(BinaryOp op, Value lhs, Value rhs) -> std::unexpected<EvalError> {
    return fail(EvalErrorKind::IntegerOverflow,
                fmt::format("integer overflow in {} {} {}", lhs, parser::to_string(op), rhs));
}

/// Keeps a nesting counter balanced on every exit path.
class DepthGuard {
   public:
    explicit DepthGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    auto operator=(const DepthGuard&) -> DepthGuard& = delete;

   private:
    std::size_t& depth_;
};

}  // namespace

auto to_string(EvalErrorKind kind) -> const char* {
    switch (kind) {
        case EvalErrorKind::UndefinedVariable:
            return "undefined variable";
        case EvalErrorKind::UndefinedFunction:
            return "undefined function";
        case EvalErrorKind::InvalidCallee:
            return "invalid callee";
        case EvalErrorKind::UnknownOperator:
            return "unknown operator";
        case EvalErrorKind::DivisionByZero:
            return "division by zero";
        case EvalErrorKind::IntegerOverflow:
            return "integer overflow";
        case EvalErrorKind::ArityMismatch:
            return "arity mismatch";
        case EvalErrorKind::VoidValue:
            return "void value";
        case EvalErrorKind::CallDepthExceeded:
            return "call depth exceeded";
        case EvalErrorKind::ExpressionTooDeep:
            return "expression too deep";
    }
    return "unknown error";
}

auto EvalError::format() const -> std::string {
    if (function.empty()) {
        return message;
    }
    return fmt::format("in function '{}': {}", function, message);
}

auto apply_binary(BinaryOp op, Value lhs, Value rhs) -> EvalResult<Value> {
    Value out = 0;
    switch (op) {
        case BinaryOp::Add:
            if (__builtin_add_overflow(lhs, rhs, &out)) {
                return overflow(op, lhs, rhs);
            }
            return out;
        case BinaryOp::Sub:
            if (__builtin_sub_overflow(lhs, rhs, &out)) {
                return overflow(op, lhs, rhs);
            }
            return out;
        case BinaryOp::Mul:
            if (__builtin_mul_overflow(lhs, rhs, &out)) {
                return overflow(op, lhs, rhs);
            }
            return out;
        case BinaryOp::Div:
            if (rhs == 0) {
                return fail(EvalErrorKind::DivisionByZero,
                            fmt::format("division by zero in {} / {}", lhs, rhs));
            }
            if (lhs == std::numeric_limits<Value>::min() && rhs == -1) {
                return overflow(op, lhs, rhs);
            }
            return lhs / rhs;
        case BinaryOp::Eq:
            return lhs == rhs ? 1 : 0;
        case BinaryOp::Ne:
            return lhs != rhs ? 1 : 0;
        case BinaryOp::Lt:
            return lhs < rhs ? 1 : 0;
        case BinaryOp::Gt:
            return lhs > rhs ? 1 : 0;
        case BinaryOp::Le:
            return lhs <= rhs ? 1 : 0;
        case BinaryOp::Ge:
            return lhs >= rhs ? 1 : 0;
    }
    return fail(EvalErrorKind::UnknownOperator,
                fmt::format("unknown operator #{}", static_cast<int>(op)));
}

Interpreter::Interpreter(InterpreterOptions options) : options_(options) {}

void Interpreter::load(const parser::Program& program) {
    functions_ = FunctionTable::from_program(program);
    spdlog::debug("registered {} function(s)", functions_.size());
}

auto Interpreter::run(const parser::Program& program) -> EvalResult<std::optional<Value>> {
    load(program);
    return call("main", {});
}

auto Interpreter::call(const std::string& name, const std::vector<Value>& args)
    -> EvalResult<std::optional<Value>> {
    const auto* decl = functions_.find(parser::Identifier{.name = name});
    if (decl == nullptr) {
        return fail(EvalErrorKind::UndefinedFunction, fmt::format("undefined function '{}'", name));
    }
    Environment root;
    return invoke(*decl, args, root);
}

auto Interpreter::evaluate(const parser::Expr& expr, Environment& env) -> EvalResult<Value> {
    if (expression_depth_ >= options_.max_expression_depth) {
        return fail(EvalErrorKind::ExpressionTooDeep,
                    fmt::format("expression nested deeper than {} levels",
                                options_.max_expression_depth));
    }
    DepthGuard guard(expression_depth_);
    return std::visit(
        [&](const auto& node) -> EvalResult<Value> {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, parser::NumberLiteral>) {
                return node.value;
            } else if constexpr (std::is_same_v<Node, parser::Identifier>) {
                auto value = env.lookup(node.name);
                if (!value.has_value()) {
                    return fail(EvalErrorKind::UndefinedVariable,
                                fmt::format("undefined variable '{}'", node.name));
                }
                return *value;
            } else if constexpr (std::is_same_v<Node, parser::BinaryExpr>) {
                return evaluate_binary(node, env);
            } else {
                static_assert(std::is_same_v<Node, parser::CallExpr>, "unhandled expression node");
                auto result = eval_call(node, env);
                if (!result.has_value()) {
                    return std::unexpected(std::move(result.error()));
                }
                if (!result->has_value()) {
                    return fail(EvalErrorKind::VoidValue,
                                fmt::format("'{}' does not produce a value",
                                            parser::to_string(expr)));
                }
                return **result;
            }
        },
        expr.node);
}

auto Interpreter::evaluate_binary(const parser::BinaryExpr& expr, Environment& env)
    -> EvalResult<Value> {
    // Left-folded chains nest down the left operand. Walk that spine with a
    // loop, leftmost operand first, so chain length costs no native stack.
    std::vector<const parser::BinaryExpr*> spine{&expr};
    const parser::Expr* leftmost = expr.left.get();
    while (const auto* inner = std::get_if<parser::BinaryExpr>(&leftmost->node)) {
        spine.push_back(inner);
        leftmost = inner->left.get();
    }

    auto acc = evaluate(*leftmost, env);
    for (auto it = spine.rbegin(); it != spine.rend() && acc.has_value(); ++it) {
        auto rhs = evaluate(*(*it)->right, env);
        if (!rhs.has_value()) {
            return std::unexpected(std::move(rhs.error()));
        }
        acc = apply_binary((*it)->op, *acc, *rhs);
    }
    return acc;
}

auto Interpreter::execute(const parser::Stmt& stmt, Environment& env) -> EvalResult<Completion> {
    return std::visit(
        [&](const auto& node) -> EvalResult<Completion> {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, parser::VarSetStmt>) {
                auto value = evaluate(*node.rhs, env);
                if (!value.has_value()) {
                    return std::unexpected(std::move(value.error()));
                }
                env.assign(node.name.name, *value);
                return Completed{};
            } else if constexpr (std::is_same_v<Node, parser::ReturnStmt>) {
                auto value = evaluate(*node.expr, env);
                if (!value.has_value()) {
                    return std::unexpected(std::move(value.error()));
                }
                return Returning{.value = *value};
            } else if constexpr (std::is_same_v<Node, parser::ExprStmt>) {
                // A call statement may produce no value; anything else must.
                if (const auto* call = std::get_if<parser::CallExpr>(&node.expr->node)) {
                    auto result = eval_call(*call, env);
                    if (!result.has_value()) {
                        return std::unexpected(std::move(result.error()));
                    }
                    return Completed{};
                }
                auto value = evaluate(*node.expr, env);
                if (!value.has_value()) {
                    return std::unexpected(std::move(value.error()));
                }
                return Completed{};
            } else if constexpr (std::is_same_v<Node, parser::Block>) {
                return execute_block(node, env);
            } else if constexpr (std::is_same_v<Node, parser::IfStmt>) {
                auto condition = evaluate(*node.condition, env);
                if (!condition.has_value()) {
                    return std::unexpected(std::move(condition.error()));
                }
                return execute_block(*condition != 0 ? node.then_block : node.else_block, env);
            } else {
                static_assert(std::is_same_v<Node, parser::WhileStmt>, "unhandled statement node");
                return execute_while(node, env);
            }
        },
        stmt.node);
}

auto Interpreter::execute_block(const parser::Block& block, Environment& parent)
    -> EvalResult<Completion> {
    auto scope = Environment::child_of(parent);
    for (const auto& stmt : block.statements) {
        auto completion = execute(*stmt, scope);
        if (!completion.has_value() || std::holds_alternative<Returning>(*completion)) {
            return completion;
        }
    }
    return Completed{};
}

auto Interpreter::execute_while(const parser::WhileStmt& loop, Environment& env)
    -> EvalResult<Completion> {
    // The condition sees the enclosing scope, which carries the body's
    // updates to existing variables from one iteration to the next.
    while (true) {
        auto condition = evaluate(*loop.condition, env);
        if (!condition.has_value()) {
            return std::unexpected(std::move(condition.error()));
        }
        if (*condition == 0) {
            return Completed{};
        }
        auto completion = execute_block(loop.block, env);
        if (!completion.has_value() || std::holds_alternative<Returning>(*completion)) {
            return completion;
        }
    }
}

auto Interpreter::eval_call(const parser::CallExpr& call, Environment& env)
    -> EvalResult<std::optional<Value>> {
    const auto* callee = std::get_if<parser::Identifier>(&call.callee->node);
    if (callee == nullptr) {
        return fail(EvalErrorKind::InvalidCallee,
                    fmt::format("invalid callee '{}': only named functions can be called",
                                parser::to_string(*call.callee)));
    }

    std::vector<Value> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        auto value = evaluate(*arg, env);
        if (!value.has_value()) {
            return std::unexpected(std::move(value.error()));
        }
        args.push_back(*value);
    }

    if (callee->name == "print") {
        if (args.size() != 1) {
            return fail(EvalErrorKind::ArityMismatch,
                        fmt::format("print expects 1 argument, got {}", args.size()));
        }
        print(args.front());
        return std::optional<Value>{};
    }

    const auto* decl = functions_.find(*callee);
    if (decl == nullptr) {
        return fail(EvalErrorKind::UndefinedFunction,
                    fmt::format("undefined function '{}'", callee->name));
    }
    return invoke(*decl, args, env);
}

auto Interpreter::invoke(const parser::FunctionDecl& decl, const std::vector<Value>& args,
                         const Environment& caller) -> EvalResult<std::optional<Value>> {
    if (args.size() != decl.params.size()) {
        return fail(EvalErrorKind::ArityMismatch,
                    fmt::format("function '{}' expects {} argument(s), got {}", decl.name.name,
                                decl.params.size(), args.size()));
    }
    if (call_depth_ >= options_.max_call_depth) {
        return fail(EvalErrorKind::CallDepthExceeded,
                    fmt::format("call to '{}' exceeds the maximum call depth of {}",
                                decl.name.name, options_.max_call_depth));
    }
    DepthGuard guard(call_depth_);
    spdlog::trace("call {} at depth {}", decl.name.name, call_depth_);

    auto frame = Environment::snapshot_of(caller);
    for (std::size_t i = 0; i < args.size(); ++i) {
        frame.define(decl.params[i].name, args[i]);
    }

    // Expression nesting is bounded per activation; the caller's count resumes
    // after the call.
    const auto caller_expression_depth = std::exchange(expression_depth_, 0);
    auto completion = execute_block(decl.body, frame);
    expression_depth_ = caller_expression_depth;
    if (!completion.has_value()) {
        auto error = std::move(completion.error());
        if (error.function.empty()) {
            error.function = decl.name.name;
        }
        return std::unexpected(std::move(error));
    }
    if (const auto* returning = std::get_if<Returning>(&*completion)) {
        return std::optional<Value>(returning->value);
    }
    return std::optional<Value>{};
}

auto Interpreter::print(Value value) -> void {
    std::ostream& out = options_.out != nullptr ? *options_.out : std::cout;
    out << fmt::format("{}\n", value);
}

auto interpret(const parser::Program& program, const InterpreterOptions& options)
    -> EvalResult<std::optional<Value>> {
    Interpreter interpreter(options);
    return interpreter.run(program);
}

}  // namespace sprig::runtime
