#pragma once
#include "../tool.hpp"

namespace mcpexec {

class CodeInterpreterTool : public Tool {
public:
    explicit CodeInterpreterTool(ExecutionDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "code_interpreter"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ExecutionDispatcher& dispatcher_;
};

} // namespace mcpexec
