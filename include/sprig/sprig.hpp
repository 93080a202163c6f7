#pragma once

/// Convenience umbrella header for the Sprig library.

#include <sprig/core/outcome.hpp>
#include <sprig/driver/driver.hpp>
#include <sprig/parser/ast.hpp>
#include <sprig/parser/combinator.hpp>
#include <sprig/parser/parser.hpp>
#include <sprig/runtime/environment.hpp>
#include <sprig/runtime/function_table.hpp>
#include <sprig/runtime/interpreter.hpp>
