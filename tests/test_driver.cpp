#include <sprig/sprig.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

namespace {

using namespace sprig::driver;

auto data_path(const std::string& name) -> std::filesystem::path {
    return std::filesystem::path(SPRIG_SOURCE_DIR) / "tests" / "data" / name;
}

}  // namespace

TEST_CASE("Run source string end to end") {
    std::ostringstream out;
    auto result = run_source("fn main() { print(7); return 2 + 3 * 4; }", RunConfig{.out = &out});
    REQUIRE(result.has_value());
    REQUIRE(result->value == std::optional<sprig::runtime::Value>(14));
    REQUIRE(out.str() == "7\n");
}

TEST_CASE("Run file returning a value") {
    auto result = run_file(data_path("factorial.sprig"));
    REQUIRE(result.has_value());
    REQUIRE(result->value == std::optional<sprig::runtime::Value>(120));
}

TEST_CASE("Run file that only prints") {
    std::ostringstream out;
    auto result = run_file(data_path("countdown.sprig"), RunConfig{.out = &out});
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->value.has_value());
    REQUIRE(out.str() == "3\n2\n1\n");
}

TEST_CASE("Run reports parse errors with their location") {
    auto result = run_file(data_path("syntax_error.sprig"));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().stage == Stage::Parse);
    REQUIRE(result.error().format() == "parse error: 3:5: expected ';', found 'return'");
}

TEST_CASE("Run reports runtime errors") {
    auto result = run_file(data_path("divide_by_zero.sprig"));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().stage == Stage::Evaluate);
    REQUIRE(result.error().format().starts_with("runtime error: in function 'ratio': "));
}

TEST_CASE("Run reports unreadable files") {
    auto result = run_file(data_path("does_not_exist.sprig"));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().stage == Stage::Io);
    REQUIRE(result.error().message.find("does_not_exist.sprig") != std::string::npos);
}

TEST_CASE("Run honors the call depth limit") {
    auto result = run_source("fn loop(n) { return loop(n); } fn main() { return loop(1); }",
                             RunConfig{.max_call_depth = 16});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().stage == Stage::Evaluate);
    REQUIRE(result.error().message.find("maximum call depth of 16") != std::string::npos);
}

TEST_CASE("Run a fifty thousand term sum") {
    std::string source = "fn main() { return 0";
    for (int i = 0; i < 50000; ++i) {
        source += " + 1";
    }
    source += "; }";
    auto result = run_source(source);
    REQUIRE(result.has_value());
    REQUIRE(result->value == std::optional<sprig::runtime::Value>(50000));
}

TEST_CASE("Run rejects deeply nested parentheses as a parse error") {
    std::string source = "fn main() { return " + std::string(5000, '(') + "1" +
                         std::string(5000, ')') + "; }";
    auto result = run_source(source);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().stage == Stage::Parse);
    REQUIRE(result.error().message.find("expression nested too deeply") != std::string::npos);
}

TEST_CASE("Run honors the expression depth limit") {
    auto result = run_source("fn main() { return 1 - (2 - (3 - (4 - 5))); }",
                             RunConfig{.max_expression_depth = 3});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().stage == Stage::Evaluate);
    REQUIRE(result.error().message.find("expression nested deeper than 3 levels") !=
            std::string::npos);
}

TEST_CASE("Run with parser tracing gives the same result") {
    auto result = run_source("fn main() { return -(1 + 2); }", RunConfig{.trace_parser = true});
    REQUIRE(result.has_value());
    REQUIRE(result->value == std::optional<sprig::runtime::Value>(-3));
}
