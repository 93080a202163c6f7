#include <sprig/driver/driver.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"sprig_run: run a Sprig program by calling its main()"};
    app.set_version_flag("--version", "sprig_run 0.1.0");

    std::string input_path;
    bool verbose = false;
    bool trace = false;
    std::size_t max_depth = sprig::driver::RunConfig{}.max_call_depth;
    std::size_t max_expression_depth = sprig::driver::RunConfig{}.max_expression_depth;
    app.add_option("input", input_path, "Sprig source file")->required();
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--trace", trace, "Log every parser invocation while parsing");
    app.add_option("--max-depth", max_depth, "Maximum nesting of function calls")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-expression-depth", max_expression_depth,
                   "Maximum nesting of expressions within one call")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    if (trace) {
        spdlog::set_level(spdlog::level::trace);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    sprig::driver::RunConfig config;
    config.trace_parser = trace;
    config.max_call_depth = max_depth;
    config.max_expression_depth = max_expression_depth;

    auto result = sprig::driver::run_file(input_path, config);
    if (!result) {
        spdlog::debug("run of '{}' failed", input_path);
        fmt::print(stderr, "sprig_run: {}: {}\n", input_path, result.error().format());
        return 1;
    }
    if (result->value.has_value()) {
        fmt::print("main() returned: {}\n", *result->value);
    } else {
        fmt::print("main() returned: nothing\n");
    }
    return 0;
}
