#include "hello_world.hpp"
#include "tool_util.hpp"
#include <iostream>

namespace mcpexec {

ToolResult HelloWorldTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    std::string name = "World";
    if (args.contains("name") && args["name"].is_string()) {
        name = args["name"].get<std::string>();
    }
    std::cerr << "[hello] Saying hello to " << name << "\n";
    return ToolResult{true, "Hello, " + name + "! Welcome to mcpexec."};
}

std::string HelloWorldTool::description() const {
    return "Simple greeting, useful to check that the server is alive";
}

std::string HelloWorldTool::parameters_json() const {
    return R"json({"type":"object","properties":{"name":{"type":"string","description":"Name to greet (default: World)"}}})json";
}

} // namespace mcpexec
