#include "config.hpp"
#include "execution_dispatcher.hpp"
#include "mcp_server.hpp"
#include "tool.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <signal.h>
#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: poll() must return EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

static void print_usage() {
    std::cerr << "Usage: mcpexec [options]\n"
              << "\n"
              << "Serves the code_interpreter, bash_tool and hello_world tools over\n"
              << "MCP (line-delimited JSON-RPC on stdin/stdout).\n"
              << "\n"
              << "Options:\n"
              << "  --root DIR           Sandbox root directory\n"
              << "  --config FILE        Config file (default: ~/.mcpexec/config.json)\n"
              << "  --verbose            Log every tool call to stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  MCPEXEC_SANDBOX_ROOT       Sandbox root directory\n"
              << "  MCPEXEC_DEFAULT_TIMEOUT    Default execution timeout in seconds\n"
              << "  MCPEXEC_MAX_OUTPUT_BYTES   Output ceiling per stream\n"
              << "  MCPEXEC_VERBOSE            Set to 1 for verbose logging\n";
}

int main(int argc, char* argv[]) try {
    std::string root;
    std::string config_path;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            root = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = mcpexec::Config::load(config_path);

    // Override config with CLI args
    if (!root.empty()) {
        config.sandbox.root = root;
    }
    if (verbose) {
        config.verbose = true;
    }

    install_signal_handlers();

    mcpexec::ExecutionDispatcher dispatcher(config);
    mcpexec::McpServer server(mcpexec::create_builtin_tools(dispatcher), STDOUT_FILENO);

    std::cerr << "[main] " << mcpexec::kServerName << " " << mcpexec::kServerVersion
              << " ready\n";
    server.serve(STDIN_FILENO, g_shutdown);

    // Foreground runs are cancelled and jobs reaped before in-flight calls
    // are awaited, so wait_idle() cannot block on a long-running command
    std::cerr << "[main] Shutting down.\n";
    dispatcher.shutdown();
    server.wait_idle();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
