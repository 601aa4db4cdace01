#include "code_interpreter.hpp"
#include "tool_util.hpp"
#include "../execution_dispatcher.hpp"

namespace mcpexec {

ToolResult CodeInterpreterTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    return dispatcher_result(dispatcher_.code_interpreter(args));
}

std::string CodeInterpreterTool::description() const {
    return "Read, write and list files in the sandbox, or execute code in a supported "
           "language (python, javascript, bash, sh, ruby, perl, php, lua, typescript, r). "
           "Pass inline code, or the path of a sandbox file to run. Output is captured "
           "and capped, with stdout and stderr each limited separately; runs past the "
           "timeout are killed.";
}

std::string CodeInterpreterTool::parameters_json() const {
    return R"json({"type":"object","properties":{"action":{"type":"string","enum":["read","write","list","execute"],"description":"Operation to perform"},"path":{"type":"string","description":"Sandbox-relative path (read, write, list, or a script to execute)"},"content":{"type":"string","description":"File content for write"},"language":{"type":"string","description":"Language for execute; inferred from the file extension when path is given"},"code":{"type":"string","description":"Inline source for execute"},"timeout":{"type":"number","description":"Timeout in seconds, clamped to the server maximum"},"cwd":{"type":"string","description":"Sandbox-relative working directory for execute"}},"required":["action"]})json";
}

} // namespace mcpexec
