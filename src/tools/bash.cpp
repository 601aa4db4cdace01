#include "bash.hpp"
#include "tool_util.hpp"
#include "../execution_dispatcher.hpp"

namespace mcpexec {

ToolResult BashTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    return dispatcher_result(dispatcher_.bash(args));
}

std::string BashTool::description() const {
    return "Run a shell command inside the sandbox. Foreground runs block until the "
           "command exits or times out. Background runs return a job_id; use status, "
           "terminate, list_jobs and remove to manage the job. The output cap applies to "
           "stdout and stderr separately.";
}

std::string BashTool::parameters_json() const {
    return R"json({"type":"object","properties":{"action":{"type":"string","enum":["run","status","terminate","list_jobs","remove"],"description":"Operation to perform (default: run)"},"command":{"type":"string","description":"Shell command for run"},"mode":{"type":"string","enum":["foreground","background"],"description":"Execution mode for run (default: foreground)"},"timeout":{"type":"number","description":"Timeout in seconds, clamped to the server maximum"},"cwd":{"type":"string","description":"Sandbox-relative working directory for run"},"job_id":{"type":"string","description":"Job identifier for status, terminate and remove"}}})json";
}

} // namespace mcpexec
