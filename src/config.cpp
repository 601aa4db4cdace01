#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace mcpexec {

nlohmann::json Config::defaults_json() {
    return {
        {"sandbox", {
            {"root", "~/.mcpexec/sandbox"},
            {"max_file_bytes", 10 * 1024 * 1024}
        }},
        {"exec", {
            {"default_timeout", 30},
            {"max_timeout", 600},
            {"kill_grace_ms", 2000},
            {"max_output_bytes", 1024 * 1024},
            {"shell", "/bin/sh"}
        }},
        {"jobs", {
            {"retention_seconds", 3600},
            {"max_retained", 100}
        }},
        {"interpreters", nlohmann::json::object()},
        {"verbose", false}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load(const std::string& config_path) {
    std::string path = config_path.empty()
        ? expand_home("~/.mcpexec/config.json")
        : expand_home(config_path);
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

// Unsigned field that fits T; anything else keeps the current value
template <typename T>
static void read_unsigned(const nlohmann::json& section, const char* section_name,
                          const char* key, T& out) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() <= std::numeric_limits<T>::max()) {
        out = static_cast<T>(value.get<uint64_t>());
        return;
    }
    std::cerr << "[config] Ignoring out-of-range " << section_name << "." << key
              << ": " << value.dump() << "\n";
}

// Plain decimal digits only; no sign, no trailing text, at most max
static bool parse_env_unsigned(const char* text, uint64_t max, uint64_t& out) {
    std::string s = trim(text);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    try {
        size_t used = 0;
        unsigned long long value = std::stoull(s, &used);
        if (used != s.size() || value > max) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("sandbox") && j["sandbox"].is_object()) {
        auto& s = j["sandbox"];
        if (s.contains("root") && s["root"].is_string())
            cfg.sandbox.root = s["root"].get<std::string>();
        read_unsigned(s, "sandbox", "max_file_bytes", cfg.sandbox.max_file_bytes);
    }

    if (j.contains("exec") && j["exec"].is_object()) {
        auto& e = j["exec"];
        read_unsigned(e, "exec", "default_timeout", cfg.exec.default_timeout);
        read_unsigned(e, "exec", "max_timeout", cfg.exec.max_timeout);
        read_unsigned(e, "exec", "kill_grace_ms", cfg.exec.kill_grace_ms);
        read_unsigned(e, "exec", "max_output_bytes", cfg.exec.max_output_bytes);
        if (e.contains("shell") && e["shell"].is_string())
            cfg.exec.shell = e["shell"].get<std::string>();
    }

    if (j.contains("jobs") && j["jobs"].is_object()) {
        auto& b = j["jobs"];
        read_unsigned(b, "jobs", "retention_seconds", cfg.jobs.retention_seconds);
        read_unsigned(b, "jobs", "max_retained", cfg.jobs.max_retained);
    }

    if (j.contains("interpreters") && j["interpreters"].is_object()) {
        for (auto& [lang, binary] : j["interpreters"].items()) {
            if (binary.is_string() && !binary.get<std::string>().empty())
                cfg.interpreters[to_lower(lang)] = binary.get<std::string>();
        }
    }

    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();

    // A default above the ceiling would be clamped on every request anyway
    if (cfg.exec.default_timeout > cfg.exec.max_timeout)
        cfg.exec.default_timeout = cfg.exec.max_timeout;

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("MCPEXEC_SANDBOX_ROOT"))
        sandbox.root = v;
    if (const char* v = std::getenv("MCPEXEC_DEFAULT_TIMEOUT")) {
        uint64_t value = 0;
        if (parse_env_unsigned(v, std::numeric_limits<uint32_t>::max(), value)) {
            exec.default_timeout = static_cast<uint32_t>(value);
        } else {
            std::cerr << "[config] Ignoring invalid MCPEXEC_DEFAULT_TIMEOUT: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("MCPEXEC_MAX_OUTPUT_BYTES")) {
        uint64_t value = 0;
        if (parse_env_unsigned(v, std::numeric_limits<uint64_t>::max(), value)) {
            exec.max_output_bytes = value;
        } else {
            std::cerr << "[config] Ignoring invalid MCPEXEC_MAX_OUTPUT_BYTES: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("MCPEXEC_VERBOSE")) {
        std::string s = to_lower(v);
        verbose = (s == "1" || s == "true" || s == "yes");
    }
    if (exec.default_timeout > exec.max_timeout)
        exec.default_timeout = exec.max_timeout;
}

} // namespace mcpexec
