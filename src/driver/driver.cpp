#include <sprig/driver/driver.hpp>
#include <sprig/parser/combinator.hpp>
#include <sprig/parser/parser.hpp>
#include <sprig/runtime/interpreter.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace sprig::driver {

namespace {

auto stage_name(Stage stage) -> const char* {
    switch (stage) {
        case Stage::Io:
            return "io";
        case Stage::Parse:
            return "parse";
        case Stage::Evaluate:
            return "runtime";
    }
    return "unknown";
}

}  // namespace

auto RunError::format() const -> std::string {
    return fmt::format("{} error: {}", stage_name(stage), message);
}

auto run_source(std::string_view source, const RunConfig& config)
    -> Outcome<RunResult, RunError> {
    auto program = [&] {
        parser::ScopedTrace trace(config.trace_parser || parser::trace_enabled());
        return parser::parse(source);
    }();
    if (!program.has_value()) {
        return std::unexpected(RunError{.stage = Stage::Parse, .message = program.error().format()});
    }
    spdlog::debug("parsed {} function declaration(s)", program->functions.size());

    runtime::Interpreter interpreter(runtime::InterpreterOptions{
        .out = config.out,
        .max_call_depth = config.max_call_depth,
        .max_expression_depth = config.max_expression_depth,
    });
    auto value = interpreter.run(*program);
    if (!value.has_value()) {
        return std::unexpected(
            RunError{.stage = Stage::Evaluate, .message = value.error().format()});
    }
    return RunResult{.value = *value};
}

auto run_file(const std::filesystem::path& path, const RunConfig& config)
    -> Outcome<RunResult, RunError> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(
            RunError{.stage = Stage::Io, .message = fmt::format("cannot open '{}'", path.string())});
    }
    std::string source(std::istreambuf_iterator<char>{input}, {});
    if (input.bad()) {
        return std::unexpected(
            RunError{.stage = Stage::Io, .message = fmt::format("cannot read '{}'", path.string())});
    }
    spdlog::debug("loaded {} ({} bytes)", path.string(), source.size());
    return run_source(source, config);
}

}  // namespace sprig::driver
