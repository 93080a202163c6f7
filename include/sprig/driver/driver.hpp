#pragma once

#include <sprig/core/outcome.hpp>
#include <sprig/runtime/environment.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace sprig::driver {

/// Configuration for one end-to-end run.
struct RunConfig {
    /// Log every parser invocation (spdlog trace level) while parsing.
    bool trace_parser = false;
    std::size_t max_call_depth = 1000;
    std::size_t max_expression_depth = 1000;
    /// Destination of `print`; std::cout when null.
    std::ostream* out = nullptr;
};

enum class Stage : std::uint8_t {
    Io,
    Parse,
    Evaluate,
};

struct RunError {
    Stage stage = Stage::Parse;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

struct RunResult {
    /// What `main` returned; empty when it finished without `return`.
    std::optional<runtime::Value> value;
};

/// Parse `source`, register its functions and call `main()`.
[[nodiscard]] auto run_source(std::string_view source, const RunConfig& config = {})
    -> Outcome<RunResult, RunError>;

/// Read a file and run it as with run_source().
[[nodiscard]] auto run_file(const std::filesystem::path& path, const RunConfig& config = {})
    -> Outcome<RunResult, RunError>;

}  // namespace sprig::driver
