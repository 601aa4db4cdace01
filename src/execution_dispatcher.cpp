#include "execution_dispatcher.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace mcpexec {

// ── Field helpers ────────────────────────────────────────────────

static bool has_field(const nlohmann::json& args, const char* field) {
    return args.contains(field) && !args[field].is_null();
}

static std::string require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        throw ExecError(ErrorKind::ValidationError,
                        std::string("Missing required parameter: ") + field);
    }
    return args[field].get<std::string>();
}

static std::string optional_string(const nlohmann::json& args, const char* field,
                                   const std::string& fallback = "") {
    if (!has_field(args, field)) return fallback;
    if (!args[field].is_string()) {
        throw ExecError(ErrorKind::ValidationError,
                        std::string("Parameter must be a string: ") + field);
    }
    return args[field].get<std::string>();
}

// Removes an inline-code script once the run is over
class ScratchFile {
public:
    explicit ScratchFile(SandboxPath path) : path_(std::move(path)) {}
    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_.path(), ec);
    }
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const SandboxPath& path() const { return path_; }

private:
    SandboxPath path_;
};

// ── JSON mapping ─────────────────────────────────────────────────

nlohmann::json error_response(ErrorKind kind, const std::string& message) {
    return {
        {"ok", false},
        {"error", {{"kind", error_kind_name(kind)}, {"message", message}}}
    };
}

nlohmann::json result_to_json(const ExecutionResult& result) {
    return {
        {"exit_code", result.exit_code},
        {"signal", result.term_signal},
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"elapsed_ms", result.elapsed.count()},
        {"truncated", result.truncated},
        {"timed_out", result.timed_out},
        {"cancelled", result.cancelled}
    };
}

nlohmann::json summary_to_json(const JobSummary& summary) {
    nlohmann::json j = {
        {"job_id", summary.id},
        {"command", summary.command},
        {"pid", summary.pid},
        {"status", job_status_name(summary.status)},
        {"started_at", summary.started_at},
        {"elapsed_ms", summary.elapsed.count()},
        {"signal", summary.term_signal}
    };
    j["exit_code"] = summary.exit_code ? nlohmann::json(*summary.exit_code) : nlohmann::json();
    return j;
}

nlohmann::json snapshot_to_json(const JobSnapshot& snapshot) {
    nlohmann::json j = summary_to_json(snapshot);
    j["stdout"] = snapshot.stdout_data;
    j["stderr"] = snapshot.stderr_data;
    j["truncated"] = snapshot.truncated;
    return j;
}

// ── ExecutionDispatcher ──────────────────────────────────────────

ExecutionDispatcher::ExecutionDispatcher(const Config& config)
    : config_(config)
    , sandbox_(config.sandbox.root)
    , registry_(config.interpreters)
    , files_(config.sandbox.max_file_bytes)
    , executor_(static_cast<size_t>(config.exec.max_output_bytes),
                std::chrono::milliseconds(config.exec.kill_grace_ms))
    , jobs_(JobManagerOptions{static_cast<size_t>(config.exec.max_output_bytes),
                              std::chrono::milliseconds(config.exec.kill_grace_ms),
                              std::chrono::seconds(config.jobs.retention_seconds),
                              config.jobs.max_retained})
{
    std::cerr << "[dispatch] Sandbox root: " << sandbox_.path().string() << "\n";
}

ExecutionDispatcher::~ExecutionDispatcher() {
    shutdown();
}

void ExecutionDispatcher::shutdown() {
    cancel_.store(true);
    jobs_.shutdown();
}

template <typename Fn>
nlohmann::json ExecutionDispatcher::guarded(const std::string& operation, Fn&& fn) {
    if (config_.verbose) {
        std::cerr << "[dispatch] " << operation << "\n";
    }
    try {
        nlohmann::json result = fn();
        result["ok"] = true;
        return result;
    } catch (const ExecError& e) {
        if (config_.verbose) {
            std::cerr << "[dispatch] " << operation << " failed: "
                      << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        }
        return error_response(e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        return error_response(ErrorKind::ValidationError, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] " << operation << " unexpected error: " << e.what() << "\n";
        return error_response(ErrorKind::ExecutionFailure, e.what());
    }
}

std::chrono::milliseconds ExecutionDispatcher::resolve_timeout(const nlohmann::json& args) const {
    double ceiling = static_cast<double>(std::max<uint32_t>(1, config_.exec.max_timeout));
    double seconds = static_cast<double>(std::max<uint32_t>(1, config_.exec.default_timeout));

    if (has_field(args, "timeout")) {
        const auto& t = args["timeout"];
        if (!t.is_number()) {
            throw ExecError(ErrorKind::ValidationError, "timeout must be a number of seconds");
        }
        seconds = t.get<double>();
        if (!std::isfinite(seconds) || seconds <= 0) {
            throw ExecError(ErrorKind::ValidationError, "timeout must be positive");
        }
    }
    seconds = std::min(seconds, ceiling);
    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
}

SandboxPath ExecutionDispatcher::resolve_cwd(const nlohmann::json& args) const {
    SandboxPath cwd = sandbox_.resolve(optional_string(args, "cwd"));
    std::error_code ec;
    if (!std::filesystem::is_directory(cwd.path(), ec)) {
        throw ExecError(ErrorKind::NotFound, "Working directory not found: " + cwd.relative());
    }
    return cwd;
}

// ── code_interpreter ─────────────────────────────────────────────

nlohmann::json ExecutionDispatcher::code_interpreter(const nlohmann::json& args) {
    if (!args.is_object()) {
        return error_response(ErrorKind::ValidationError, "Arguments must be an object");
    }
    if (!args.contains("action") || !args["action"].is_string()) {
        return error_response(ErrorKind::ValidationError, "Missing required parameter: action");
    }

    std::string action = args["action"].get<std::string>();
    std::string op = "code_interpreter." + action;
    if (action == "read")    return guarded(op, [&] { return read_file(args); });
    if (action == "write")   return guarded(op, [&] { return write_file(args); });
    if (action == "list")    return guarded(op, [&] { return list_dir(args); });
    if (action == "execute") return guarded(op, [&] { return execute_code(args); });
    return error_response(ErrorKind::ValidationError,
                          "Unknown action: " + action + " (expected read, write, list or execute)");
}

nlohmann::json ExecutionDispatcher::read_file(const nlohmann::json& args) {
    SandboxPath path = sandbox_.resolve(require_string(args, "path"));
    std::string content = files_.read(path);
    return {{"path", path.relative()}, {"content", content}, {"size", content.size()}};
}

nlohmann::json ExecutionDispatcher::write_file(const nlohmann::json& args) {
    std::string raw = require_string(args, "path");
    std::string content = require_string(args, "content");
    SandboxPath path = sandbox_.resolve(raw);
    if (path.path() == sandbox_.path()) {
        throw ExecError(ErrorKind::ValidationError, "Cannot write to the sandbox root");
    }
    uint64_t written = files_.write(path, content);
    return {{"path", path.relative()}, {"bytes_written", written}};
}

nlohmann::json ExecutionDispatcher::list_dir(const nlohmann::json& args) {
    SandboxPath path = sandbox_.resolve(optional_string(args, "path"));
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : files_.list(path)) {
        entries.push_back({{"name", entry.name}, {"type", entry.type}, {"size", entry.size}});
    }
    return {{"path", path.relative()}, {"entries", entries}};
}

nlohmann::json ExecutionDispatcher::execute_code(const nlohmann::json& args) {
    bool has_code = has_field(args, "code");
    bool has_path = has_field(args, "path");
    if (has_code == has_path) {
        throw ExecError(ErrorKind::ValidationError,
                        "execute requires exactly one of: code, path");
    }

    std::string language = optional_string(args, "language");
    auto timeout = resolve_timeout(args);
    SandboxPath cwd = resolve_cwd(args);

    if (has_path) {
        SandboxPath script = sandbox_.resolve(require_string(args, "path"));
        std::error_code ec;
        if (!std::filesystem::is_regular_file(script.path(), ec)) {
            throw ExecError(ErrorKind::NotFound, "File not found: " + script.relative());
        }
        const LanguageSpec* spec = nullptr;
        if (!language.empty()) {
            spec = &registry_.lookup(language);
        } else {
            spec = registry_.find_by_extension(script.path().extension().string());
            if (!spec) {
                throw ExecError(ErrorKind::ValidationError,
                                "Missing required parameter: language (cannot infer from " +
                                script.relative() + ")");
            }
        }
        ExecutionResult result = executor_.run(command_for(*spec, script.string()),
                                               cwd, timeout, &cancel_);
        nlohmann::json j = result_to_json(result);
        j["language"] = spec->id;
        return j;
    }

    if (language.empty()) {
        throw ExecError(ErrorKind::ValidationError, "Missing required parameter: language");
    }
    const LanguageSpec& spec = registry_.lookup(language);
    std::string code = require_string(args, "code");

    ScratchFile scratch(sandbox_.resolve(".mcpexec/scratch/snippet-" + generate_id() + spec.extension));
    files_.write(scratch.path(), code);

    ExecutionResult result = executor_.run(command_for(spec, scratch.path().string()),
                                           cwd, timeout, &cancel_);
    nlohmann::json j = result_to_json(result);
    j["language"] = spec.id;
    return j;
}

// ── bash_tool ────────────────────────────────────────────────────

nlohmann::json ExecutionDispatcher::bash(const nlohmann::json& args) {
    if (!args.is_object()) {
        return error_response(ErrorKind::ValidationError, "Arguments must be an object");
    }

    std::string action = "run";
    if (has_field(args, "action")) {
        if (!args["action"].is_string()) {
            return error_response(ErrorKind::ValidationError, "Parameter must be a string: action");
        }
        action = args["action"].get<std::string>();
    }

    std::string op = "bash_tool." + action;
    if (action == "run")       return guarded(op, [&] { return run_command(args); });
    if (action == "status")    return guarded(op, [&] { return job_status(args); });
    if (action == "terminate") return guarded(op, [&] { return terminate_job(args); });
    if (action == "list_jobs") return guarded(op, [&] { return list_jobs(); });
    if (action == "remove")    return guarded(op, [&] { return remove_job(args); });
    return error_response(ErrorKind::ValidationError,
                          "Unknown action: " + action +
                          " (expected run, status, terminate, list_jobs or remove)");
}

nlohmann::json ExecutionDispatcher::run_command(const nlohmann::json& args) {
    std::string command = require_string(args, "command");
    if (trim(command).empty()) {
        throw ExecError(ErrorKind::ValidationError, "command must not be empty");
    }
    std::string mode = optional_string(args, "mode", "foreground");
    if (mode != "foreground" && mode != "background") {
        throw ExecError(ErrorKind::ValidationError,
                        "mode must be 'foreground' or 'background', got '" + mode + "'");
    }
    auto timeout = resolve_timeout(args);
    SandboxPath cwd = resolve_cwd(args);
    Command cmd = shell_command(config_.exec.shell, command);

    if (mode == "background") {
        std::string job_id = jobs_.launch(cmd, cwd, timeout);
        return {{"job_id", job_id}, {"status", job_status_name(JobStatus::Running)}};
    }
    return result_to_json(executor_.run(cmd, cwd, timeout, &cancel_));
}

nlohmann::json ExecutionDispatcher::job_status(const nlohmann::json& args) {
    std::string job_id = require_string(args, "job_id");
    auto snap = jobs_.status(job_id);
    if (!snap) {
        throw ExecError(ErrorKind::NotFound, "No such job: " + job_id);
    }
    return snapshot_to_json(*snap);
}

nlohmann::json ExecutionDispatcher::terminate_job(const nlohmann::json& args) {
    std::string job_id = require_string(args, "job_id");
    if (!jobs_.terminate(job_id)) {
        throw ExecError(ErrorKind::NotFound, "No such job: " + job_id);
    }
    auto snap = jobs_.status(job_id);
    std::string status = snap ? job_status_name(snap->status) : job_status_name(JobStatus::Terminated);
    return {{"job_id", job_id}, {"status", status}};
}

nlohmann::json ExecutionDispatcher::list_jobs() {
    nlohmann::json jobs = nlohmann::json::array();
    for (const auto& summary : jobs_.list()) {
        jobs.push_back(summary_to_json(summary));
    }
    return {{"jobs", jobs}};
}

nlohmann::json ExecutionDispatcher::remove_job(const nlohmann::json& args) {
    std::string job_id = require_string(args, "job_id");
    if (!jobs_.remove(job_id)) {
        throw ExecError(ErrorKind::NotFound, "No such job: " + job_id);
    }
    return {{"job_id", job_id}, {"removed", true}};
}

} // namespace mcpexec
