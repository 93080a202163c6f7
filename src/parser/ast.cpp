#include <sprig/parser/ast.hpp>

#include <fmt/core.h>

#include <type_traits>
#include <utility>
#include <vector>

namespace sprig::parser {

auto to_string(BinaryOp op) -> const char* {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Ge:
            return ">=";
    }
    return "?";
}

Expr::~Expr() {
    auto* binary = std::get_if<BinaryExpr>(&node);
    if (binary == nullptr) {
        return;
    }
    std::vector<ExprPtr> pending;
    pending.push_back(std::move(binary->left));
    pending.push_back(std::move(binary->right));
    while (!pending.empty()) {
        ExprPtr expr = std::move(pending.back());
        pending.pop_back();
        if (expr == nullptr) {
            continue;
        }
        if (auto* inner = std::get_if<BinaryExpr>(&expr->node)) {
            pending.push_back(std::move(inner->left));
            pending.push_back(std::move(inner->right));
        }
    }
}

auto make_number(std::int64_t value) -> ExprPtr {
    auto expr = std::make_unique<Expr>();
    expr->node = NumberLiteral{.value = value};
    return expr;
}

auto make_identifier(std::string name) -> ExprPtr {
    auto expr = std::make_unique<Expr>();
    expr->node = Identifier{.name = std::move(name)};
    return expr;
}

auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    auto expr = std::make_unique<Expr>();
    expr->node = BinaryExpr{.op = op, .left = std::move(left), .right = std::move(right)};
    return expr;
}

auto make_call(ExprPtr callee, std::vector<ExprPtr> args) -> ExprPtr {
    auto expr = std::make_unique<Expr>();
    expr->node = CallExpr{.callee = std::move(callee), .args = std::move(args)};
    return expr;
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, NumberLiteral>) {
                return fmt::format("{}", node.value);
            } else if constexpr (std::is_same_v<Node, Identifier>) {
                return node.name;
            } else if constexpr (std::is_same_v<Node, BinaryExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left), to_string(node.op),
                                   to_string(*node.right));
            } else {
                std::string out = to_string(*node.callee);
                out.push_back('(');
                for (std::size_t i = 0; i < node.args.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(to_string(*node.args[i]));
                }
                out.push_back(')');
                return out;
            }
        },
        expr.node);
}

}  // namespace sprig::parser
