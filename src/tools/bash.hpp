#pragma once
#include "../tool.hpp"

namespace mcpexec {

class BashTool : public Tool {
public:
    explicit BashTool(ExecutionDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "bash_tool"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ExecutionDispatcher& dispatcher_;
};

} // namespace mcpexec
