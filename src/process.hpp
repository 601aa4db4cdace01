#pragma once
#include "interpreter_registry.hpp"
#include "sandbox_root.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>

namespace mcpexec {

struct ExecutionResult {
    int exit_code = -1;       // 128 + signal when killed by a signal
    int term_signal = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::milliseconds elapsed{0};
    bool truncated = false;
    bool timed_out = false;
    bool cancelled = false;
};

// Receives output as it is read from the child: (stdout chunk, stderr chunk).
// Either chunk may be empty.
using OutputSink = std::function<void(const std::string& out, const std::string& err)>;

// Owns one child process: its pid (which is also its process group id) and
// the read ends of its stdout/stderr pipes. Single owner; not thread-safe.
// Destroying a handle whose process is still alive kills the group and reaps.
class ProcessHandle {
public:
    // Start command in a new session rooted at cwd. Start failures (fork,
    // chdir, exec) throw ExecError(ExecutionFailure).
    static std::unique_ptr<ProcessHandle> spawn(const Command& command, const std::string& cwd);

    ~ProcessHandle();
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

    // Wait up to wait_ms for output and hand it to sink.
    // Returns false once both pipes have reached EOF.
    bool pump(int wait_ms, const OutputSink& sink);

    // Non-blocking waitpid. True once the process has been reaped.
    bool try_reap();

    // Blocking waitpid.
    void wait();

    // Signal the whole group (falls back to the pid before the first reap).
    void signal_group(int sig);

    // SIGTERM the group, keep draining for `grace`, SIGKILL if the leader is
    // still alive, reap. Safe to call on an already-reaped process.
    void terminate(std::chrono::milliseconds grace, const OutputSink& sink);

    // After the leader has been reaped: kill leftover group members and
    // collect whatever output is still buffered.
    void finish(const OutputSink& sink);

    int exit_code() const;
    int term_signal() const;

private:
    ProcessHandle(pid_t pid, int out_fd, int err_fd);

    size_t read_ready(int wait_ms, const OutputSink& sink);
    void drain(const OutputSink& sink);

    pid_t pid_;
    int out_fd_;
    int err_fd_;
    bool reaped_ = false;
    int status_ = 0;
};

enum class SuperviseOutcome { Exited, TimedOut, Stopped };

// Drive a process to completion: pump output, reap on exit, and escalate
// (terminate) on deadline expiry or when *stop becomes true. Shared by the
// foreground executor and background job monitors.
SuperviseOutcome supervise(ProcessHandle& proc,
                           std::chrono::steady_clock::time_point deadline,
                           std::chrono::milliseconds grace,
                           const std::atomic<bool>* stop,
                           const OutputSink& sink);

// Blocking execution of a single command. Stateless apart from its limits,
// so one executor can serve any number of concurrent runs.
class ProcessExecutor {
public:
    ProcessExecutor(size_t max_output_bytes, std::chrono::milliseconds kill_grace);

    ExecutionResult run(const Command& command,
                        const SandboxPath& cwd,
                        std::chrono::milliseconds timeout,
                        const std::atomic<bool>* cancel = nullptr) const;

    size_t max_output_bytes() const { return max_output_bytes_; }
    std::chrono::milliseconds kill_grace() const { return kill_grace_; }

private:
    size_t max_output_bytes_;
    std::chrono::milliseconds kill_grace_;
};

} // namespace mcpexec
