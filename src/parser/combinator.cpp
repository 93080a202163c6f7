#include <sprig/parser/combinator.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <system_error>

namespace sprig::parser {

namespace {

bool trace_on = false;
std::size_t trace_depth = 0;

auto is_space(char ch) -> bool {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

auto is_digit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

auto is_alpha(char ch) -> bool {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

auto is_alnum(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

void set_trace_enabled(bool enabled) {
    trace_on = enabled;
    trace_depth = 0;
}

auto trace_enabled() -> bool {
    return trace_on;
}

ScopedTrace::ScopedTrace(bool enabled) : previous_(trace_on) {
    set_trace_enabled(enabled);
}

ScopedTrace::~ScopedTrace() {
    set_trace_enabled(previous_);
}

auto skip_whitespace(Cursor input) -> Cursor {
    const auto rest = input.rest();
    std::size_t count = 0;
    while (count < rest.size() && is_space(rest[count])) {
        ++count;
    }
    return input.advance(count);
}

auto preview(Cursor input, std::size_t max_length) -> std::string {
    auto text = input.rest().substr(0, max_length);
    return std::string(text.substr(0, text.find('\n')));
}

auto describe(Cursor input, std::size_t max_length) -> std::string {
    if (input.at_end()) {
        return "end of input";
    }
    if (input.rest().front() == '\n') {
        return "end of line";
    }
    return "'" + preview(input, max_length) + "'";
}

namespace detail {

void trace_enter(std::string_view name, Cursor input) {
    spdlog::trace("{:{}}trying {} on: {}...", "", trace_depth * 2, name, preview(input));
    ++trace_depth;
}

void trace_success(std::string_view name, Cursor input, Cursor rest) {
    if (trace_depth > 0) {
        --trace_depth;
    }
    spdlog::trace("{:{}}{} succeeded, consumed {} chars", "", trace_depth * 2, name,
                  rest.offset - input.offset);
}

void trace_failure(std::string_view name, const ParseFailure& failure) {
    if (trace_depth > 0) {
        --trace_depth;
    }
    spdlog::trace("{:{}}{} failed: {}", "", trace_depth * 2, name, failure.message);
}

}  // namespace detail

auto char_if(std::function<bool(char)> pred, std::string name) -> Parser<char> {
    std::string label = name;
    return Parser<char>(
        [pred = std::move(pred), name = std::move(name)](Cursor input) -> ParseOutcome<char> {
            const auto rest = input.rest();
            if (!rest.empty() && pred(rest.front())) {
                return Parsed<char>{.value = rest.front(), .rest = input.advance(1)};
            }
            return std::unexpected(ParseFailure{
                .message = "expected " + name + ", found " + describe(input, 1),
                .offset = input.offset,
            });
        },
        std::move(label));
}

auto just(std::string token) -> Parser<std::string> {
    std::string name = "just('" + token + "')";
    return Parser<std::string>(
        [token = std::move(token)](Cursor input) -> ParseOutcome<std::string> {
            if (input.rest().starts_with(token)) {
                return Parsed<std::string>{.value = token, .rest = input.advance(token.size())};
            }
            return std::unexpected(ParseFailure{
                .message = "expected '" + token + "', found " + describe(input, token.size() + 5),
                .offset = input.offset,
            });
        },
        std::move(name));
}

auto accumulate_while(std::function<bool(char)> pred) -> Parser<std::string> {
    return Parser<std::string>(
        [pred = std::move(pred)](Cursor input) -> ParseOutcome<std::string> {
            const auto rest = input.rest();
            std::size_t count = 0;
            while (count < rest.size() && pred(rest[count])) {
                ++count;
            }
            return Parsed<std::string>{
                .value = std::string(rest.substr(0, count)),
                .rest = input.advance(count),
            };
        },
        "accumulate_while");
}

auto whitespace() -> Parser<std::string> {
    return accumulate_while(is_space).label("whitespace");
}

auto number() -> Parser<std::int64_t> {
    auto digits = accumulate_while(is_digit);
    return Parser<std::int64_t>(
        [digits](Cursor input) -> ParseOutcome<std::int64_t> {
            auto run = digits(input);
            if (!run.has_value() || run->value.empty()) {
                return std::unexpected(ParseFailure{
                    .message = "expected a number, found " + describe(input, 10),
                    .offset = input.offset,
                });
            }
            const auto& text = run->value;
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return std::unexpected(ParseFailure{
                    .message = "integer literal '" + text + "' is out of range",
                    .offset = input.offset,
                });
            }
            return Parsed<std::int64_t>{.value = value, .rest = run->rest};
        },
        "number");
}

auto ident() -> Parser<std::string> {
    return Parser<std::string>(
        [](Cursor input) -> ParseOutcome<std::string> {
            const auto rest = input.rest();
            if (rest.empty() || !is_alpha(rest.front())) {
                return std::unexpected(ParseFailure{
                    .message = "expected an identifier, found " + describe(input, 10),
                    .offset = input.offset,
                });
            }
            std::size_t count = 1;
            while (count < rest.size() && is_alnum(rest[count])) {
                ++count;
            }
            return Parsed<std::string>{
                .value = std::string(rest.substr(0, count)),
                .rest = input.advance(count),
            };
        },
        "ident");
}

}  // namespace sprig::parser
