#include "mcp_server.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <unistd.h>

namespace mcpexec {

nlohmann::json rpc_result(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json rpc_error(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

static void write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[mcp] Failed to write response: " << std::strerror(errno) << "\n";
            return;
        }
        written += static_cast<size_t>(n);
    }
}

McpServer::McpServer(std::vector<std::unique_ptr<Tool>> tools, int out_fd)
    : McpServer(std::move(tools), [out_fd](const std::string& line) { write_all(out_fd, line); })
{}

McpServer::McpServer(std::vector<std::unique_ptr<Tool>> tools, Writer writer)
    : tools_(std::move(tools))
    , writer_(std::move(writer))
{}

McpServer::~McpServer() {
    wait_idle();
}

Tool* McpServer::find_tool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

nlohmann::json McpServer::tools_list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tools_) {
        auto spec = tool->spec();
        tools.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", nlohmann::json::parse(spec.parameters_json)}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json McpServer::call_tool(const nlohmann::json& params) {
    std::string name = params["name"].get<std::string>();
    Tool* tool = find_tool(name);

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    ToolResult result{false, ""};
    try {
        result = tool->execute(arguments.dump());
    } catch (const std::exception& e) {
        std::cerr << "[mcp] Tool " << name << " threw: " << e.what() << "\n";
        result = ToolResult{false, std::string("Tool failed: ") + e.what()};
    }

    return {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", result.output}}})},
        {"isError", !result.success}
    };
}

std::optional<nlohmann::json> McpServer::handle_message(const nlohmann::json& msg) {
    if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string()) {
        nlohmann::json id = msg.is_object() && msg.contains("id") ? msg["id"] : nlohmann::json();
        return rpc_error(id, kInvalidRequest, "Invalid request");
    }

    bool notification = !msg.contains("id");
    nlohmann::json id = notification ? nlohmann::json() : msg["id"];
    std::string method = msg["method"].get<std::string>();

    if (notification) {
        // notifications/initialized and friends need no action
        return std::nullopt;
    }

    nlohmann::json params = nlohmann::json::object();
    if (msg.contains("params") && !msg["params"].is_null()) {
        params = msg["params"];
        if (!params.is_object()) {
            return rpc_error(id, kInvalidParams, "params must be an object");
        }
    }

    if (method == "initialize") {
        return rpc_result(id, {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
        });
    }
    if (method == "ping") {
        return rpc_result(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return rpc_result(id, tools_list());
    }
    if (method == "tools/call") {
        if (!params.contains("name") || !params["name"].is_string()) {
            return rpc_error(id, kInvalidParams, "Missing tool name");
        }
        if (!find_tool(params["name"].get<std::string>())) {
            return rpc_error(id, kInvalidParams,
                             "Unknown tool: " + params["name"].get<std::string>());
        }
        if (params.contains("arguments") && !params["arguments"].is_null() &&
            !params["arguments"].is_object()) {
            return rpc_error(id, kInvalidParams, "arguments must be an object");
        }
        return rpc_result(id, call_tool(params));
    }
    return rpc_error(id, kMethodNotFound, "Method not found: " + method);
}

void McpServer::write_response(const nlohmann::json& response) {
    // Invalid UTF-8 from process output is replaced rather than thrown
    std::string line = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';
    std::lock_guard<std::mutex> lock(write_mutex_);
    writer_(line);
}

void McpServer::prune_finished() {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    for (auto it = inflight_.begin(); it != inflight_.end(); ) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = inflight_.erase(it);
        } else {
            ++it;
        }
    }
}

void McpServer::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return;

    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        write_response(rpc_error(nullptr, kParseError, std::string("Parse error: ") + e.what()));
        return;
    }

    bool is_call = msg.is_object() && msg.contains("id") && msg.contains("method") &&
                   msg["method"].is_string() && msg["method"] == "tools/call";
    if (!is_call) {
        if (auto response = handle_message(msg)) write_response(*response);
        return;
    }

    prune_finished();
    auto task = std::async(std::launch::async, [this, msg = std::move(msg)]() {
        nlohmann::json response;
        try {
            auto handled = handle_message(msg);
            if (!handled) return;
            response = std::move(*handled);
        } catch (const std::exception& e) {
            std::cerr << "[mcp] tools/call failed: " << e.what() << "\n";
            response = rpc_error(msg["id"], kInvalidParams, e.what());
        }
        write_response(response);
    });
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.push_back(std::move(task));
}

void McpServer::serve(int in_fd, const std::atomic<bool>& shutdown) {
    std::string pending;
    char buffer[65536];

    std::cerr << "[mcp] Serving " << tools_.size() << " tool(s) on stdio\n";
    while (!shutdown.load()) {
        struct pollfd pfd;
        pfd.fd = in_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[mcp] poll failed: " << std::strerror(errno) << "\n";
            break;
        }
        if (ret == 0) continue;

        ssize_t n = ::read(in_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::cerr << "[mcp] read failed: " << std::strerror(errno) << "\n";
            break;
        }
        if (n == 0) {
            if (!pending.empty()) handle_line(pending);
            std::cerr << "[mcp] Input closed\n";
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            handle_line(line);
        }
    }
}

void McpServer::wait_idle() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        pending.swap(inflight_);
    }
    for (auto& task : pending) {
        task.get();
    }
}

} // namespace mcpexec
