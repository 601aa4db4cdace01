#include "tool.hpp"
#include "tools/bash.hpp"
#include "tools/code_interpreter.hpp"
#include "tools/hello_world.hpp"

namespace mcpexec {

std::vector<std::unique_ptr<Tool>> create_builtin_tools(ExecutionDispatcher& dispatcher) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<CodeInterpreterTool>(dispatcher));
    tools.push_back(std::make_unique<BashTool>(dispatcher));
    tools.push_back(std::make_unique<HelloWorldTool>());
    return tools;
}

} // namespace mcpexec
