#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "file_store.hpp"
#include "interpreter_registry.hpp"
#include "job_manager.hpp"
#include "process.hpp"
#include "sandbox_root.hpp"
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

namespace mcpexec {

// Entry point for the code_interpreter and bash_tool surfaces. Validates
// request fields, applies the timeout policy, routes to the file store,
// executor or job manager, and maps every outcome (including every error)
// to a JSON object carrying "ok".
class ExecutionDispatcher {
public:
    explicit ExecutionDispatcher(const Config& config);
    ~ExecutionDispatcher();

    ExecutionDispatcher(const ExecutionDispatcher&) = delete;
    ExecutionDispatcher& operator=(const ExecutionDispatcher&) = delete;

    // actions: read, write, list, execute
    nlohmann::json code_interpreter(const nlohmann::json& args);

    // actions: run (default), status, terminate, list_jobs, remove
    nlohmann::json bash(const nlohmann::json& args);

    // Cancel in-flight foreground runs, terminate and reap background jobs
    void shutdown();

    const SandboxRoot& sandbox() const { return sandbox_; }
    const InterpreterRegistry& interpreters() const { return registry_; }
    BackgroundJobManager& jobs() { return jobs_; }

    // Effective timeout for a request: default when absent, clamped to the
    // ceiling. Throws ExecError(ValidationError) for non-positive values.
    std::chrono::milliseconds resolve_timeout(const nlohmann::json& args) const;

private:
    nlohmann::json read_file(const nlohmann::json& args);
    nlohmann::json write_file(const nlohmann::json& args);
    nlohmann::json list_dir(const nlohmann::json& args);
    nlohmann::json execute_code(const nlohmann::json& args);

    nlohmann::json run_command(const nlohmann::json& args);
    nlohmann::json job_status(const nlohmann::json& args);
    nlohmann::json terminate_job(const nlohmann::json& args);
    nlohmann::json list_jobs();
    nlohmann::json remove_job(const nlohmann::json& args);

    SandboxPath resolve_cwd(const nlohmann::json& args) const;

    template <typename Fn>
    nlohmann::json guarded(const std::string& operation, Fn&& fn);

    Config config_;
    SandboxRoot sandbox_;
    InterpreterRegistry registry_;
    FileStore files_;
    ProcessExecutor executor_;
    BackgroundJobManager jobs_;
    std::atomic<bool> cancel_{false};
};

nlohmann::json error_response(ErrorKind kind, const std::string& message);
nlohmann::json result_to_json(const ExecutionResult& result);
nlohmann::json summary_to_json(const JobSummary& summary);
nlohmann::json snapshot_to_json(const JobSnapshot& snapshot);

} // namespace mcpexec
