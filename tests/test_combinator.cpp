#include <sprig/parser/combinator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace sprig::parser;

auto is_digit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

template <typename T>
void require_untouched_failure(const Parser<T>& parser, std::string_view input) {
    const Cursor start{.source = input, .offset = 0};
    auto result = parser(start);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().remaining == start);
}

}  // namespace

TEST_CASE("Leaf parsers consume what they match") {
    auto digits = number().parse("123abc");
    REQUIRE(digits.has_value());
    REQUIRE(digits->value == 123);
    REQUIRE(digits->rest.rest() == "abc");

    auto word = ident().parse("abc1 rest");
    REQUIRE(word.has_value());
    REQUIRE(word->value == "abc1");
    REQUIRE(word->rest.rest() == " rest");

    auto token = just("fn").parse("fn main");
    REQUIRE(token.has_value());
    REQUIRE(token->value == "fn");
    REQUIRE(token->rest.offset == 2);

    auto ch = char_if(is_digit, "digit").parse("7x");
    REQUIRE(ch.has_value());
    REQUIRE(ch->value == '7');
}

TEST_CASE("number rejects empty runs and out-of-range literals") {
    REQUIRE_FALSE(number().parse("abc").has_value());
    REQUIRE_FALSE(number().parse("").has_value());
    REQUIRE_FALSE(number().parse("-1").has_value());

    auto huge = number().parse("99999999999999999999");
    REQUIRE_FALSE(huge.has_value());
    REQUIRE(huge.error().message.find("out of range") != std::string::npos);

    auto max = number().parse("9223372036854775807");
    REQUIRE(max.has_value());
    REQUIRE(max->value == 9223372036854775807LL);
}

TEST_CASE("ident requires a leading letter") {
    REQUIRE_FALSE(ident().parse("1abc").has_value());
    REQUIRE_FALSE(ident().parse("_x").has_value());
    REQUIRE(ident().parse("x1y2")->value == "x1y2");
}

TEST_CASE("accumulate_while never fails") {
    auto empty = accumulate_while(is_digit).parse("abc");
    REQUIRE(empty.has_value());
    REQUIRE(empty->value.empty());
    REQUIRE(empty->rest.offset == 0);
}

TEST_CASE("Failure never consumes input") {
    require_untouched_failure(number(), "x");
    require_untouched_failure(just("while"), "whale");
    require_untouched_failure(number().then(just("+")), "12-");
    require_untouched_failure(number().padded().then_ignore(just(";")), "   42 ;");
    require_untouched_failure(just("(").ignore_then(number()).then_ignore(just(")")), "(1]");
    require_untouched_failure(number().or_else(number().map([](std::int64_t v) { return v; })),
                              "ab");
    require_untouched_failure(number().eof(), "1 2");
    require_untouched_failure(number().filter([](std::int64_t v) { return v > 10; }, "small"),
                              "3");
}

TEST_CASE("Failures keep the offset where the problem was found") {
    auto result = number().then(just("+")).then(number()).parse("12+x");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().offset == 3);
    REQUIRE(result.error().remaining.offset == 0);
}

TEST_CASE("padded skips leading whitespace only") {
    auto plain = number().padded().parse("3");
    auto spaced = number().padded().parse(" \t\n3");
    REQUIRE(plain.has_value());
    REQUIRE(spaced.has_value());
    REQUIRE(plain->value == 3);
    REQUIRE(spaced->value == 3);

    auto trailing = number().padded().parse(" 3  ");
    REQUIRE(trailing.has_value());
    REQUIRE(trailing->rest.rest() == "  ");
}

TEST_CASE("or_else retries from the original position") {
    auto keyword = just("if").then(just("x")).map([](auto&&) { return std::string("if x"); });
    auto either = keyword.or_else(just("iff"));
    auto result = either.parse("iff");
    REQUIRE(result.has_value());
    REQUIRE(result->value == "iff");
    REQUIRE(result->rest.at_end());
}

TEST_CASE("or_else reports the last attempted failure") {
    auto result = just("a").or_else(just("b")).parse("c");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message.find("'b'") != std::string::npos);
}

TEST_CASE("or_else reports the failure that got furthest") {
    auto assignment = ident().then(just("=")).then(number()).map([](auto&&) { return 1; });
    auto call = ident().then(just("(")).map([](auto&&) { return 2; });

    auto result = assignment.or_else(call).parse("x=;");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().offset == 2);
    REQUIRE(result.error().message.find("number") != std::string::npos);

    auto reversed = call.or_else(assignment).parse("x=;");
    REQUIRE_FALSE(reversed.has_value());
    REQUIRE(reversed.error().offset == 2);
    REQUIRE(reversed.error().remaining.offset == 0);
}

TEST_CASE("expect renames failures that made no progress") {
    auto operand = number().padded().or_else(ident().padded()).expect("an operand");

    auto empty = operand.parse("  ;");
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().message == "expected an operand, found ';'");
    REQUIRE(empty.error().offset == 2);

    auto at_end = operand.parse("");
    REQUIRE(at_end.error().message == "expected an operand, found end of input");

    auto deeper = just("(").then(number()).map([](auto&&) { return 0; }).expect("a group");
    auto partial = deeper.parse("(x");
    REQUIRE_FALSE(partial.has_value());
    REQUIRE(partial.error().offset == 1);
    REQUIRE(partial.error().message.find("number") != std::string::npos);
}

TEST_CASE("Diagnostics stop at the end of the line") {
    auto result = just(";").parse("x\ny");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message == "expected ';', found 'x'");

    auto line_end = just(";").parse("\n;");
    REQUIRE(line_end.error().message == "expected ';', found end of line");
}

TEST_CASE("nested limits recursion depth") {
    // group := '(' group ')' | number, nested at most three deep
    auto group = recursive<std::int64_t>([](const Parser<std::int64_t>& self) {
        return self.nested(3, "too deep")
            .between(just("("), just(")"))
            .map([](std::int64_t depth) { return depth + 1; })
            .or_else(number().map([](std::int64_t) -> std::int64_t { return 0; }));
    });

    auto ok = group.eof().parse("(((1)))");
    REQUIRE(ok.has_value());
    REQUIRE(ok->value == 3);
    REQUIRE(ok->rest.depth == 0);

    auto too_deep = group.eof().parse("((((1))))");
    REQUIRE_FALSE(too_deep.has_value());
    REQUIRE(too_deep.error().message == "too deep");
    REQUIRE(too_deep.error().offset == 4);
}

TEST_CASE("repeated_until blames the item that broke off") {
    auto statement = ident().then_ignore(just(";")).padded();
    auto body = statement.repeated_until(just("}").padded());

    auto ok = body.parse("a; b; }");
    REQUIRE(ok.has_value());
    REQUIRE(ok->value == std::vector<std::string>{"a", "b"});
    REQUIRE(ok->rest.at_end());

    auto empty = body.parse(" }");
    REQUIRE(empty.has_value());
    REQUIRE(empty->value.empty());

    auto broken = body.parse("a; b }");
    REQUIRE_FALSE(broken.has_value());
    REQUIRE(broken.error().offset == 4);
    REQUIRE(broken.error().message == "expected ';', found ' }'");
    REQUIRE(broken.error().remaining.offset == 0);

    auto unterminated = body.parse("a; 1");
    REQUIRE_FALSE(unterminated.has_value());
    REQUIRE(unterminated.error().offset == 3);
    REQUIRE(unterminated.error().message == "expected '}', found '1'");
}

TEST_CASE("then pairs both values") {
    auto pair = number().then(just(",").ignore_then(number())).parse("1,2");
    REQUIRE(pair.has_value());
    REQUIRE(pair->value.first == 1);
    REQUIRE(pair->value.second == 2);
    REQUIRE(pair->rest.at_end());
}

TEST_CASE("between keeps only the inner value") {
    auto result = number().between(just("("), just(")")).parse("(42)!");
    REQUIRE(result.has_value());
    REQUIRE(result->value == 42);
    REQUIRE(result->rest.rest() == "!");
}

TEST_CASE("sep_by collects delimited items and never fails") {
    auto list = number().padded().sep_by(just(",").padded());

    auto three = list.parse("1, 2 ,3");
    REQUIRE(three.has_value());
    REQUIRE(three->value == std::vector<std::int64_t>{1, 2, 3});

    auto none = list.parse(")");
    REQUIRE(none.has_value());
    REQUIRE(none->value.empty());
    REQUIRE(none->rest.offset == 0);

    auto dangling = list.parse("1,2,");
    REQUIRE(dangling.has_value());
    REQUIRE(dangling->value.size() == 2);
    REQUIRE(dangling->rest.rest() == ",");
}

TEST_CASE("repeated collects until the first failure") {
    auto result = just("-").repeated().parse("---3");
    REQUIRE(result.has_value());
    REQUIRE(result->value.size() == 3);
    REQUIRE(result->rest.rest() == "3");

    auto none = just("-").repeated().parse("3");
    REQUIRE(none.has_value());
    REQUIRE(none->value.empty());
}

TEST_CASE("Loop combinators stop on zero-width successes") {
    auto zero_width = accumulate_while(is_digit);

    auto repeated = zero_width.repeated().parse("abc");
    REQUIRE(repeated.has_value());
    REQUIRE(repeated->value.empty());
    REQUIRE(repeated->rest.offset == 0);

    auto progressing = zero_width.repeated().parse("12ab");
    REQUIRE(progressing.has_value());
    REQUIRE(progressing->value == std::vector<std::string>{"12"});
    REQUIRE(progressing->rest.rest() == "ab");

    auto optional_items = just("x").or_not().repeated().parse("xxy");
    REQUIRE(optional_items.has_value());
    REQUIRE(optional_items->value.size() == 2);

    auto separated = zero_width.sep_by(whitespace()).parse("abc");
    REQUIRE(separated.has_value());
    REQUIRE(separated->value.empty());
}

TEST_CASE("or_not yields nullopt without consuming") {
    auto present = number().or_not().parse("5");
    REQUIRE(present.has_value());
    REQUIRE(present->value == std::optional<std::int64_t>{5});

    auto missing = number().or_not().parse("x");
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->value.has_value());
    REQUIRE(missing->rest.offset == 0);
}

TEST_CASE("eof requires the input to be exhausted") {
    REQUIRE(number().eof().parse("12").has_value());
    auto trailing = number().eof().parse("12 ");
    REQUIRE_FALSE(trailing.has_value());
    REQUIRE(trailing.error().offset == 2);
}

TEST_CASE("try_map rejects at the original position") {
    auto even = number().try_map([](std::int64_t v) -> sprig::Outcome<std::int64_t, std::string> {
        if (v % 2 != 0) {
            return std::unexpected(std::string("odd"));
        }
        return v / 2;
    });
    REQUIRE(even.parse("8")->value == 4);
    auto odd = even.parse("7");
    REQUIRE_FALSE(odd.has_value());
    REQUIRE(odd.error().message == "odd");
    REQUIRE(odd.error().offset == 0);
}

TEST_CASE("recursive parsers can refer to themselves") {
    // nested := '(' nested ')' | digit-run
    auto nested = recursive<std::int64_t>([](const Parser<std::int64_t>& self) {
        return self.between(just("("), just(")"))
            .map([](std::int64_t depth) { return depth + 1; })
            .or_else(number().map([](std::int64_t) -> std::int64_t { return 0; }));
    });
    auto result = nested.eof().parse("(((7)))");
    REQUIRE(result.has_value());
    REQUIRE(result->value == 3);

    REQUIRE_FALSE(nested.eof().parse("((7)").has_value());
}

TEST_CASE("Parsers are immutable values") {
    auto base = number();
    auto labelled = base.label("digits");
    REQUIRE(base.name() == "number");
    REQUIRE(labelled.name() == "digits");
    REQUIRE(base.parse("5")->value == labelled.parse("5")->value);
}

TEST_CASE("Tracing does not change results") {
    auto parser = number().padded().sep_by(just(",").padded());
    auto quiet = parser.parse("1, 2, x");
    std::vector<std::int64_t> traced_values;
    {
        ScopedTrace trace;
        REQUIRE(trace_enabled());
        auto traced = parser.parse("1, 2, x");
        REQUIRE(traced.has_value());
        traced_values = traced->value;
        REQUIRE(traced->rest == quiet->rest);
    }
    REQUIRE_FALSE(trace_enabled());
    REQUIRE(traced_values == quiet->value);
}
