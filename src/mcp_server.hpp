#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpexec {

constexpr const char* kServerName = "mcpexec";
constexpr const char* kServerVersion = "0.1.0";
constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

// Line-delimited JSON-RPC 2.0 server exposing tools over MCP.
class McpServer {
public:
    using Writer = std::function<void(const std::string& line)>;

    // Responses go to out_fd, one JSON document per line
    explicit McpServer(std::vector<std::unique_ptr<Tool>> tools, int out_fd = 1);
    McpServer(std::vector<std::unique_ptr<Tool>> tools, Writer writer);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Handle one decoded message synchronously. Returns nullopt for
    // notifications.
    std::optional<nlohmann::json> handle_message(const nlohmann::json& msg);

    // Decode and answer one line. tools/call runs on its own worker.
    void handle_line(const std::string& line);

    // Read lines from in_fd until EOF or shutdown is raised. Does not wait
    // for in-flight calls.
    void serve(int in_fd, const std::atomic<bool>& shutdown);

    // Block until every in-flight tools/call has written its response
    void wait_idle();

    size_t tool_count() const { return tools_.size(); }

private:
    nlohmann::json tools_list() const;
    nlohmann::json call_tool(const nlohmann::json& params);
    Tool* find_tool(const std::string& name) const;
    void write_response(const nlohmann::json& response);
    void prune_finished();

    std::vector<std::unique_ptr<Tool>> tools_;
    Writer writer_;
    std::mutex write_mutex_;
    std::mutex inflight_mutex_;
    std::vector<std::future<void>> inflight_;
};

nlohmann::json rpc_result(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json rpc_error(const nlohmann::json& id, int code, const std::string& message);

} // namespace mcpexec
