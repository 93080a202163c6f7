#include <sprig/parser/combinator.hpp>
#include <sprig/parser/parser.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sprig::parser {

namespace {

constexpr std::array<std::string_view, 5> kKeywords = {"fn", "return", "if", "else", "while"};

using OperatorChain = std::vector<std::pair<BinaryOp, ExprPtr>>;
using FunctionParts = std::pair<std::pair<Identifier, std::vector<Identifier>>, Block>;

template <typename Node>
auto make_stmt(Node node) -> StmtPtr {
    auto stmt = std::make_unique<Stmt>();
    stmt->node = std::move(node);
    return stmt;
}

auto make_error(std::string_view source, std::string message, std::size_t offset)
    -> ParseError {
    offset = std::min(offset, source.size());
    std::size_t line = 1;
    std::size_t column = 1;
    for (std::size_t i = 0; i < offset; ++i) {
        if (source[i] == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
    }
    return ParseError{
        .message = std::move(message),
        .offset = offset,
        .line = line,
        .column = column,
    };
}

/// Punctuation or operator text, after optional whitespace.
auto token(std::string text) -> Parser<std::string> {
    std::string name = "'" + text + "'";
    return just(std::move(text)).padded().label(std::move(name));
}

/// A reserved word that is not the prefix of a longer identifier.
auto keyword(std::string word) -> Parser<std::string> {
    auto boundary =
        char_if([](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) != 0; },
                "identifier character")
            .or_not()
            .filter([](const std::optional<char>& next) { return !next.has_value(); },
                    fmt::format("expected '{}', found a longer identifier", word));
    std::string name = word;
    return just(std::move(word)).then_ignore(std::move(boundary)).padded().label(std::move(name));
}

auto identifier() -> Parser<Identifier> {
    return ident()
        .padded()
        .try_map([](std::string&& word) -> Outcome<Identifier, std::string> {
            if (is_keyword(word)) {
                return std::unexpected(
                    fmt::format("'{}' is a keyword and cannot be used as a name", word));
            }
            return Identifier{.name = std::move(word)};
        })
        .label("identifier");
}

auto binary_op(std::string text, BinaryOp op) -> Parser<BinaryOp> {
    return token(std::move(text)).map([op](std::string&&) { return op; });
}

auto fold_left(std::pair<ExprPtr, OperatorChain>&& chain) -> ExprPtr {
    auto expr = std::move(chain.first);
    for (auto& [op, rhs] : chain.second) {
        expr = make_binary(op, std::move(expr), std::move(rhs));
    }
    return expr;
}

/// One left-associative precedence level: operand (op operand)*.
auto binary_level(const Parser<ExprPtr>& operand, const Parser<BinaryOp>& op, std::string name)
    -> Parser<ExprPtr> {
    return operand.then(op.then(operand).repeated()).map(fold_left).label(std::move(name));
}

auto build_expression(const Parser<ExprPtr>& self) -> Parser<ExprPtr> {
    // Each '(' opens one nesting level, counted after the parenthesis so the
    // limit failure outranks the alternatives that never got past it.
    auto expr = self.nested(kMaxNestingDepth, "expression nested too deeply");
    auto number_literal = number()
                              .padded()
                              .map([](std::int64_t value) { return make_number(value); })
                              .label("number");
    auto variable = identifier()
                        .map([](Identifier&& id) { return make_identifier(std::move(id.name)); })
                        .label("variable");
    auto parenthesized = expr.between(token("("), token(")")).label("parenthesized");
    auto atom = number_literal.or_else(variable)
                    .or_else(parenthesized)
                    .expect("an expression")
                    .label("atom");

    // The atom is parsed once and the argument list is optional, so a failed
    // call attempt never re-parses the callee.
    auto arguments = expr.sep_by(token(",")).between(token("("), token(")")).label("arguments");
    auto atom_or_call =
        atom.then(arguments.or_not())
            .map([](std::pair<ExprPtr, std::optional<std::vector<ExprPtr>>>&& parts) -> ExprPtr {
                if (!parts.second.has_value()) {
                    return std::move(parts.first);
                }
                return make_call(std::move(parts.first), std::move(*parts.second));
            })
            .label("atom_or_call");

    // Unary only wraps atom_or_call, so -2 * 2 is (-2) * 2. An odd number of
    // minus signs becomes a multiplication by -1.
    auto unary =
        token("-")
            .repeated()
            .then(atom_or_call)
            .map([](std::pair<std::vector<std::string>, ExprPtr>&& parts) -> ExprPtr {
                if (parts.first.size() % 2 == 0) {
                    return std::move(parts.second);
                }
                return make_binary(BinaryOp::Mul, make_number(-1), std::move(parts.second));
            })
            .label("unary");

    auto product = binary_level(
        unary, binary_op("*", BinaryOp::Mul).or_else(binary_op("/", BinaryOp::Div)), "product");
    auto sum = binary_level(
        product, binary_op("+", BinaryOp::Add).or_else(binary_op("-", BinaryOp::Sub)), "sum");

    // Two-character operators first, otherwise "<=" would match as "<".
    auto comparison_op = binary_op("==", BinaryOp::Eq)
                             .or_else(binary_op("!=", BinaryOp::Ne))
                             .or_else(binary_op("<=", BinaryOp::Le))
                             .or_else(binary_op(">=", BinaryOp::Ge))
                             .or_else(binary_op("<", BinaryOp::Lt))
                             .or_else(binary_op(">", BinaryOp::Gt));
    return binary_level(sum, comparison_op, "expression");
}

auto build_block(const Parser<ExprPtr>& expr, const Parser<Block>& block) -> Parser<Block> {
    auto semicolon = token(";");

    auto return_stmt =
        keyword("return")
            .ignore_then(expr)
            .map([](ExprPtr&& value) { return make_stmt(ReturnStmt{.expr = std::move(value)}); })
            .label("return");

    auto var_set = identifier()
                       .then_ignore(token("="))
                       .then(expr)
                       .map([](std::pair<Identifier, ExprPtr>&& parts) {
                           return make_stmt(VarSetStmt{
                               .name = std::move(parts.first),
                               .rhs = std::move(parts.second),
                           });
                       })
                       .label("assignment");

    auto expr_stmt =
        expr.map([](ExprPtr&& value) { return make_stmt(ExprStmt{.expr = std::move(value)}); })
            .label("expression statement");

    auto if_stmt =
        keyword("if")
            .ignore_then(expr)
            .then(block)
            .then(keyword("else").ignore_then(block).or_not())
            .map([](std::pair<std::pair<ExprPtr, Block>, std::optional<Block>>&& parts) {
                auto& [condition, then_block] = parts.first;
                return make_stmt(IfStmt{
                    .condition = std::move(condition),
                    .then_block = std::move(then_block),
                    .else_block = parts.second.has_value() ? std::move(*parts.second) : Block{},
                });
            })
            .label("if");

    auto while_stmt = keyword("while")
                          .ignore_then(expr)
                          .then(block)
                          .map([](std::pair<ExprPtr, Block>&& parts) {
                              return make_stmt(WhileStmt{
                                  .condition = std::move(parts.first),
                                  .block = std::move(parts.second),
                              });
                          })
                          .label("while");

    auto nested_block =
        block.map([](Block&& inner) { return make_stmt(std::move(inner)); }).label("nested block");

    // Statements ending in a block take an optional ';'; the rest require one.
    auto compound =
        if_stmt.or_else(while_stmt).or_else(nested_block).then_ignore(semicolon.or_not());
    auto simple = return_stmt.then_ignore(semicolon)
                      .or_else(var_set.then_ignore(semicolon))
                      .or_else(expr_stmt.then_ignore(semicolon));
    auto statement = compound.or_else(simple).label("statement");

    return token("{")
        .ignore_then(statement.repeated_until(token("}"))
                         .nested(kMaxNestingDepth, "block nested too deeply"))
        .map([](std::vector<StmtPtr>&& statements) {
            return Block{.statements = std::move(statements)};
        })
        .label("block");
}

auto build_function(FunctionParts&& parts) -> Outcome<FunctionDecl, std::string> {
    auto& [name, params] = parts.first;
    std::unordered_set<std::string> seen;
    for (const auto& param : params) {
        if (!seen.insert(param.name).second) {
            return std::unexpected(fmt::format("duplicate parameter '{}' in function '{}'",
                                               param.name, name.name));
        }
    }
    return FunctionDecl{
        .name = std::move(name),
        .params = std::move(params),
        .body = std::move(parts.second),
    };
}

struct Grammar {
    Parser<ExprPtr> expression;
    Parser<FunctionDecl> function;
    Parser<Program> program;
};

auto build_grammar() -> Grammar {
    auto expression = recursive<ExprPtr>(
        [](const Parser<ExprPtr>& self) { return build_expression(self); });
    auto block = recursive<Block>(
        [&expression](const Parser<Block>& self) { return build_block(expression, self); });

    auto params =
        identifier().sep_by(token(",")).between(token("("), token(")")).label("parameters");
    auto function = keyword("fn")
                        .ignore_then(identifier())
                        .then(params)
                        .then(block)
                        .try_map(build_function)
                        .label("function");
    auto program = function.repeated()
                       .then_ignore(whitespace())
                       .eof()
                       .map([](std::vector<FunctionDecl>&& functions) {
                           return Program{.functions = std::move(functions)};
                       })
                       .label("program");

    return Grammar{
        .expression = expression.then_ignore(whitespace()).eof().label("expression"),
        .function = function,
        .program = program,
    };
}

auto grammar() -> const Grammar& {
    static const Grammar instance = build_grammar();
    return instance;
}

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("{}:{}: {}", line, column, message);
}

auto is_keyword(std::string_view word) -> bool {
    return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

auto parse(std::string_view source) -> ParseResult {
    const auto& rules = grammar();
    auto result = rules.program.parse(source);
    if (result.has_value()) {
        return std::move(result->value);
    }
    auto failure = std::move(result.error());
    // The program parser only fails where its declaration loop stopped short of
    // the end; re-running one declaration there says why.
    auto declaration = rules.function(Cursor{.source = source, .offset = failure.offset});
    if (!declaration.has_value()) {
        failure = std::move(declaration.error());
    }
    return std::unexpected(make_error(source, std::move(failure.message), failure.offset));
}

auto parse_expression(std::string_view source) -> ExprParseResult {
    auto result = grammar().expression.parse(source);
    if (!result.has_value()) {
        return std::unexpected(
            make_error(source, std::move(result.error().message), result.error().offset));
    }
    return std::move(result->value);
}

}  // namespace sprig::parser
