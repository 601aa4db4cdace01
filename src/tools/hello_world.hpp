#pragma once
#include "../tool.hpp"

namespace mcpexec {

class HelloWorldTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "hello_world"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mcpexec
