#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace mcpexec {

struct SandboxConfig {
    std::string root = "~/.mcpexec/sandbox";
    uint64_t max_file_bytes = 10 * 1024 * 1024;
};

struct ExecConfig {
    uint32_t default_timeout = 30;   // seconds, applied when a request has none
    uint32_t max_timeout = 600;      // seconds, ceiling for request overrides
    uint32_t kill_grace_ms = 2000;   // SIGTERM -> SIGKILL interval
    uint64_t max_output_bytes = 1024 * 1024; // per stream
    std::string shell = "/bin/sh";
};

struct JobsConfig {
    uint32_t retention_seconds = 3600;
    uint32_t max_retained = 100;     // finished jobs kept for status queries
};

struct Config {
    SandboxConfig sandbox;
    ExecConfig exec;
    JobsConfig jobs;
    bool verbose = false;

    // Language id -> interpreter binary override
    std::unordered_map<std::string, std::string> interpreters;

    // Load from config_path (default ~/.mcpexec/config.json) + env vars
    static Config load(const std::string& config_path = "");

    // Parse an already-merged JSON document
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply MCPEXEC_* environment overrides
    void apply_env();
};

} // namespace mcpexec
