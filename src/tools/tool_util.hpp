#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace mcpexec {

// Parse JSON tool arguments. Returns error ToolResult on failure.
// An empty argument string is treated as an empty object.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    if (args_json.empty()) {
        out = nlohmann::json::object();
        return std::nullopt;
    }
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Failed to parse arguments: expected a JSON object"};
    }
    return std::nullopt;
}

// Dispatcher responses carry "ok"; the tool result mirrors it. Process
// output may hold invalid UTF-8, which is replaced rather than thrown.
inline ToolResult dispatcher_result(const nlohmann::json& response) {
    bool ok = response.value("ok", false);
    return ToolResult{ok, response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

} // namespace mcpexec
