#pragma once

#include <sprig/core/outcome.hpp>
#include <sprig/parser/ast.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace sprig::parser {

/// Deepest allowed nesting of parentheses, call arguments and blocks, counted
/// together. Deeper input is a parse error.
inline constexpr std::size_t kMaxNestingDepth = 256;

/// Parse error with location information.
struct ParseError {
    std::string message;
    std::size_t offset = 0;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for parse operations.
using ParseResult = Outcome<Program, ParseError>;
using ExprParseResult = Outcome<ExprPtr, ParseError>;

/// Parse a Sprig source string into a Program AST.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

/// Parse a single expression; the whole input must be consumed.
[[nodiscard]] auto parse_expression(std::string_view source) -> ExprParseResult;

/// True for the reserved words `fn`, `return`, `if`, `else` and `while`.
[[nodiscard]] auto is_keyword(std::string_view word) -> bool;

}  // namespace sprig::parser
