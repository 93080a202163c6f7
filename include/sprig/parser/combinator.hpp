#pragma once

#include <sprig/core/outcome.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sprig::parser {

/// A position in the input: the whole source plus a byte offset into it.
///
/// `depth` counts the `nested()` parsers entered on the way here.
struct Cursor {
    std::string_view source;
    std::size_t offset = 0;
    std::size_t depth = 0;

    /// Input that has not been consumed yet.
    [[nodiscard]] auto rest() const noexcept -> std::string_view { return source.substr(offset); }
    [[nodiscard]] auto at_end() const noexcept -> bool { return offset >= source.size(); }
    [[nodiscard]] auto advance(std::size_t count) const noexcept -> Cursor {
        return Cursor{.source = source, .offset = offset + count, .depth = depth};
    }

    friend auto operator==(const Cursor&, const Cursor&) -> bool = default;
};

/// Why a parser failed.
///
/// `offset` is where the problem was detected, which may lie deep inside the
/// input. `remaining` is always the failing parser's own input: a failure
/// never consumes anything.
struct ParseFailure {
    std::string message;
    std::size_t offset = 0;
    Cursor remaining;
};

/// A parsed value and the input left after it.
template <typename T>
struct Parsed {
    T value;
    Cursor rest;
};

template <typename T>
using ParseOutcome = Outcome<Parsed<T>, ParseFailure>;

// ─── Tracing ──────────────────────────────────────────────────────────────────
//  Process-wide and diagnostic only. When enabled, every parser invocation is
//  logged through spdlog at trace level, indented by nesting depth.

void set_trace_enabled(bool enabled);
[[nodiscard]] auto trace_enabled() -> bool;

/// Enables (or disables) tracing for the lifetime of the guard.
class ScopedTrace {
   public:
    explicit ScopedTrace(bool enabled = true);
    ~ScopedTrace();

    ScopedTrace(const ScopedTrace&) = delete;
    auto operator=(const ScopedTrace&) -> ScopedTrace& = delete;

   private:
    bool previous_;
};

/// Skip leading whitespace.
[[nodiscard]] auto skip_whitespace(Cursor input) -> Cursor;

/// Up to `max_length` characters of the remaining input, stopping at the end
/// of the line, for diagnostics.
[[nodiscard]] auto preview(Cursor input, std::size_t max_length = 20) -> std::string;

/// What a failing parser found at `input`: the quoted preview, `end of line`
/// or `end of input`.
[[nodiscard]] auto describe(Cursor input, std::size_t max_length = 10) -> std::string;

namespace detail {

void trace_enter(std::string_view name, Cursor input);
void trace_success(std::string_view name, Cursor input, Cursor rest);
void trace_failure(std::string_view name, const ParseFailure& failure);

}  // namespace detail

template <typename T>
class Parser;

// ─── Parser ───────────────────────────────────────────────────────────────────

/// A named, side-effect-free function from a cursor to a parse outcome.
///
/// Parsers are values: copies share one immutable callable, and every
/// combinator returns a new parser without touching its operands.
template <typename T>
class Parser {
   public:
    using value_type = T;
    using Function = std::function<ParseOutcome<T>(Cursor)>;

    Parser(Function fn, std::string name)
        : fn_(std::make_shared<const Function>(std::move(fn))), name_(std::move(name)) {}

    /// Run the parser. A failure always reports `input` as its remaining input.
    auto operator()(Cursor input) const -> ParseOutcome<T> {
        const bool tracing = trace_enabled();
        if (tracing) {
            detail::trace_enter(name_, input);
        }
        auto result = (*fn_)(input);
        if (!result.has_value()) {
            result.error().remaining = input;
        }
        if (tracing) {
            if (result.has_value()) {
                detail::trace_success(name_, input, result->rest);
            } else {
                detail::trace_failure(name_, result.error());
            }
        }
        return result;
    }

    /// Run the parser from the start of `source`. `source` must outlive the result.
    [[nodiscard]] auto parse(std::string_view source) const -> ParseOutcome<T> {
        return (*this)(Cursor{.source = source, .offset = 0});
    }

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    /// The same parser under a different trace name.
    [[nodiscard]] auto label(std::string name) const -> Parser<T> {
        Parser<T> copy = *this;
        copy.name_ = std::move(name);
        return copy;
    }

    template <typename F>
    [[nodiscard]] auto map(F f) const -> Parser<std::invoke_result_t<const F&, T&&>> {
        using U = std::invoke_result_t<const F&, T&&>;
        return Parser<U>(
            [self = *this, f = std::move(f)](Cursor input) -> ParseOutcome<U> {
                return sprig::map(self(input), [&f](Parsed<T>&& parsed) {
                    return Parsed<U>{.value = f(std::move(parsed.value)), .rest = parsed.rest};
                });
            },
            name_ + ".map");
    }

    /// Like `map`, but `f` may reject the value by returning an error message.
    /// A rejection fails at the original position.
    template <typename F>
    [[nodiscard]] auto try_map(F f) const
        -> Parser<typename std::invoke_result_t<const F&, T&&>::value_type> {
        using U = typename std::invoke_result_t<const F&, T&&>::value_type;
        return Parser<U>(
            [self = *this, f = std::move(f)](Cursor input) -> ParseOutcome<U> {
                auto result = self(input);
                if (!result.has_value()) {
                    return std::unexpected(std::move(result.error()));
                }
                auto mapped = f(std::move(result->value));
                if (!mapped.has_value()) {
                    return std::unexpected(ParseFailure{
                        .message = std::move(mapped.error()),
                        .offset = input.offset,
                    });
                }
                return Parsed<U>{.value = std::move(*mapped), .rest = result->rest};
            },
            name_ + ".try_map");
    }

    /// Succeeds only when `pred` accepts the parsed value.
    template <typename Pred>
    [[nodiscard]] auto filter(Pred pred, std::string message) const -> Parser<T> {
        return Parser<T>(
            [self = *this, pred = std::move(pred), message](Cursor input) -> ParseOutcome<T> {
                auto result = self(input);
                if (!result.has_value()) {
                    return result;
                }
                if (!pred(std::as_const(result->value))) {
                    return std::unexpected(ParseFailure{.message = message, .offset = input.offset});
                }
                return result;
            },
            name_ + ".filter");
    }

    template <typename U>
    [[nodiscard]] auto then(Parser<U> next) const -> Parser<std::pair<T, U>> {
        using Pair = std::pair<T, U>;
        std::string name = name_ + ".then(" + next.name() + ")";
        return Parser<Pair>(
            [self = *this, next = std::move(next)](Cursor input) -> ParseOutcome<Pair> {
                auto first = self(input);
                if (!first.has_value()) {
                    return std::unexpected(std::move(first.error()));
                }
                auto second = next(first->rest);
                if (!second.has_value()) {
                    return std::unexpected(std::move(second.error()));
                }
                return Parsed<Pair>{
                    .value = Pair(std::move(first->value), std::move(second->value)),
                    .rest = second->rest,
                };
            },
            std::move(name));
    }

    template <typename U>
    [[nodiscard]] auto ignore_then(Parser<U> next) const -> Parser<U> {
        std::string name = name_ + ".ignore_then(" + next.name() + ")";
        return then(std::move(next))
            .map([](std::pair<T, U>&& pair) { return std::move(pair.second); })
            .label(std::move(name));
    }

    template <typename U>
    [[nodiscard]] auto then_ignore(Parser<U> next) const -> Parser<T> {
        std::string name = name_ + ".then_ignore(" + next.name() + ")";
        return then(std::move(next))
            .map([](std::pair<T, U>&& pair) { return std::move(pair.first); })
            .label(std::move(name));
    }

    /// Try this parser; on failure retry `alternative` from the same input.
    /// When both fail, the failure detected furthest into the input is
    /// reported; on a tie, the alternative's.
    [[nodiscard]] auto or_else(Parser<T> alternative) const -> Parser<T> {
        std::string name = name_ + ".or_else(" + alternative.name() + ")";
        return Parser<T>(
            [self = *this, alternative = std::move(alternative)](Cursor input) -> ParseOutcome<T> {
                auto result = self(input);
                if (result.has_value()) {
                    return result;
                }
                auto retry = alternative(input);
                if (retry.has_value() || retry.error().offset >= result.error().offset) {
                    return retry;
                }
                return result;
            },
            std::move(name));
    }

    /// Report a failure that got no further than leading whitespace as
    /// `expected <what>`.
    [[nodiscard]] auto expect(std::string what) const -> Parser<T> {
        return Parser<T>(
            [self = *this, what](Cursor input) -> ParseOutcome<T> {
                auto result = self(input);
                if (result.has_value()) {
                    return result;
                }
                const Cursor start = skip_whitespace(input);
                if (result.error().offset <= start.offset) {
                    result.error().message = "expected " + what + ", found " + describe(start);
                    result.error().offset = start.offset;
                }
                return result;
            },
            name_);
    }

    /// Run this parser one nesting level deeper. Fails with `message` when
    /// the input is already `max_depth` levels deep.
    [[nodiscard]] auto nested(std::size_t max_depth, std::string message) const -> Parser<T> {
        return Parser<T>(
            [self = *this, max_depth, message](Cursor input) -> ParseOutcome<T> {
                if (input.depth >= max_depth) {
                    return std::unexpected(ParseFailure{.message = message, .offset = input.offset});
                }
                Cursor inner = input;
                ++inner.depth;
                auto result = self(inner);
                if (result.has_value()) {
                    result->rest.depth = input.depth;
                }
                return result;
            },
            name_);
    }

    /// Skip leading whitespace, then run this parser. Trailing whitespace is left alone.
    [[nodiscard]] auto padded() const -> Parser<T> {
        return Parser<T>([self = *this](Cursor input) { return self(skip_whitespace(input)); },
                         name_ + ".padded()");
    }

    template <typename Open, typename Close>
    [[nodiscard]] auto between(Parser<Open> open, Parser<Close> close) const -> Parser<T> {
        std::string name = name_ + ".between(" + open.name() + ", " + close.name() + ")";
        return open.ignore_then(*this).then_ignore(std::move(close)).label(std::move(name));
    }

    /// Zero or more items separated by `delimiter`. Never fails.
    ///
    /// An iteration that succeeds without consuming input ends the loop and
    /// its value is discarded.
    template <typename D>
    [[nodiscard]] auto sep_by(Parser<D> delimiter) const -> Parser<std::vector<T>> {
        std::string name = name_ + ".sep_by(" + delimiter.name() + ")";
        auto tail = delimiter.ignore_then(*this);
        return Parser<std::vector<T>>(
            [self = *this, tail = std::move(tail)](Cursor input) -> ParseOutcome<std::vector<T>> {
                std::vector<T> values;
                Cursor rest = input;
                for (bool first = true;; first = false) {
                    auto item = first ? self(rest) : tail(rest);
                    if (!item.has_value() || item->rest.offset == rest.offset) {
                        break;
                    }
                    values.push_back(std::move(item->value));
                    rest = item->rest;
                }
                return Parsed<std::vector<T>>{.value = std::move(values), .rest = rest};
            },
            std::move(name));
    }

    /// Zero or more items. Never fails; stops on failure or on an iteration
    /// that consumes nothing.
    [[nodiscard]] auto repeated() const -> Parser<std::vector<T>> {
        return Parser<std::vector<T>>(
            [self = *this](Cursor input) -> ParseOutcome<std::vector<T>> {
                std::vector<T> values;
                Cursor rest = input;
                while (true) {
                    auto item = self(rest);
                    if (!item.has_value() || item->rest.offset == rest.offset) {
                        break;
                    }
                    values.push_back(std::move(item->value));
                    rest = item->rest;
                }
                return Parsed<std::vector<T>>{.value = std::move(values), .rest = rest};
            },
            name_ + ".repeated()");
    }

    /// Zero or more items followed by `end`, as `repeated()` then `end`.
    ///
    /// When `end` does not match, the failure reported is whichever of the
    /// last item's failure and `end`'s got further into the input, so a
    /// malformed item is blamed rather than the missing terminator.
    template <typename U>
    [[nodiscard]] auto repeated_until(Parser<U> end) const -> Parser<std::vector<T>> {
        std::string name = name_ + ".repeated_until(" + end.name() + ")";
        return Parser<std::vector<T>>(
            [self = *this, end = std::move(end)](Cursor input) -> ParseOutcome<std::vector<T>> {
                std::vector<T> values;
                Cursor rest = input;
                std::optional<ParseFailure> item_failure;
                while (true) {
                    auto item = self(rest);
                    if (!item.has_value()) {
                        item_failure = std::move(item.error());
                        break;
                    }
                    if (item->rest.offset == rest.offset) {
                        break;
                    }
                    values.push_back(std::move(item->value));
                    rest = item->rest;
                }
                auto closing = end(rest);
                if (!closing.has_value()) {
                    if (item_failure.has_value() && item_failure->offset > closing.error().offset) {
                        return std::unexpected(std::move(*item_failure));
                    }
                    return std::unexpected(std::move(closing.error()));
                }
                return Parsed<std::vector<T>>{.value = std::move(values), .rest = closing->rest};
            },
            std::move(name));
    }

    /// This parser's value, or `std::nullopt` without consuming input. Never fails.
    [[nodiscard]] auto or_not() const -> Parser<std::optional<T>> {
        return Parser<std::optional<T>>(
            [self = *this](Cursor input) -> ParseOutcome<std::optional<T>> {
                auto result = self(input);
                if (!result.has_value()) {
                    return Parsed<std::optional<T>>{.value = std::nullopt, .rest = input};
                }
                return Parsed<std::optional<T>>{
                    .value = std::optional<T>(std::move(result->value)),
                    .rest = result->rest,
                };
            },
            "or_not(" + name_ + ")");
    }

    /// Succeeds only if this parser leaves no input behind.
    [[nodiscard]] auto eof() const -> Parser<T> {
        return Parser<T>(
            [self = *this](Cursor input) -> ParseOutcome<T> {
                auto result = self(input);
                if (!result.has_value()) {
                    return result;
                }
                if (!result->rest.at_end()) {
                    return std::unexpected(ParseFailure{
                        .message = "expected end of input, found " + describe(result->rest, 20),
                        .offset = result->rest.offset,
                    });
                }
                return result;
            },
            name_ + ".eof()");
    }

   private:
    std::shared_ptr<const Function> fn_;
    std::string name_;
};

// ─── Leaf parsers ─────────────────────────────────────────────────────────────

/// One character satisfying `pred`.
[[nodiscard]] auto char_if(std::function<bool(char)> pred, std::string name = "char")
    -> Parser<char>;

/// Exactly `token`.
[[nodiscard]] auto just(std::string token) -> Parser<std::string>;

/// The longest prefix whose characters satisfy `pred`. Never fails; may be empty.
[[nodiscard]] auto accumulate_while(std::function<bool(char)> pred) -> Parser<std::string>;

/// A possibly empty run of whitespace.
[[nodiscard]] auto whitespace() -> Parser<std::string>;

/// An unsigned run of decimal digits that fits in a signed 64-bit integer.
[[nodiscard]] auto number() -> Parser<std::int64_t>;

/// A letter followed by letters and digits.
[[nodiscard]] auto ident() -> Parser<std::string>;

// ─── Recursion ────────────────────────────────────────────────────────────────

/// Build a self-referential parser.
///
/// `define` receives a forward reference and returns the real definition; the
/// reference is bound to that definition before the result is returned. The
/// reference holds the definition weakly, so it only resolves while the
/// returned parser (or a copy of it) is alive.
template <typename T, typename F>
[[nodiscard]] auto recursive(F define) -> Parser<T> {
    struct Cell {
        std::optional<Parser<T>> definition;
    };
    auto cell = std::make_shared<Cell>();
    Parser<T> forward(
        [weak = std::weak_ptr<Cell>(cell)](Cursor input) -> ParseOutcome<T> {
            auto target = weak.lock();
            if (!target || !target->definition.has_value()) {
                return std::unexpected(ParseFailure{
                    .message = "recursive parser used outside its definition",
                    .offset = input.offset,
                });
            }
            return (*target->definition)(input);
        },
        "recursive");
    cell->definition.emplace(define(forward));
    std::string name = cell->definition->name();
    return Parser<T>([cell](Cursor input) { return (*cell->definition)(input); },
                     std::move(name));
}

}  // namespace sprig::parser
