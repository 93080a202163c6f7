#include <sprig/runtime/function_table.hpp>

#include <spdlog/spdlog.h>

namespace sprig::runtime {

auto FunctionTable::from_program(const parser::Program& program) -> FunctionTable {
    FunctionTable table;
    for (const auto& decl : program.functions) {
        if (table.register_function(decl)) {
            spdlog::debug("function '{}' redefined; the later declaration wins", decl.name.name);
        }
    }
    return table;
}

}  // namespace sprig::runtime
