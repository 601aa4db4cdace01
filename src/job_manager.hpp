#pragma once
#include "interpreter_registry.hpp"
#include "output_buffer.hpp"
#include "process.hpp"
#include "sandbox_root.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpexec {

enum class JobStatus { Running, Exited, Terminated, TimedOut };

const char* job_status_name(JobStatus status);

struct JobSummary {
    std::string id;
    std::string command;
    pid_t pid = 0;
    JobStatus status = JobStatus::Running;
    uint64_t started_at = 0; // epoch seconds
    std::chrono::milliseconds elapsed{0};
    std::optional<int> exit_code;
    int term_signal = 0;
};

struct JobSnapshot : JobSummary {
    std::string stdout_data;
    std::string stderr_data;
    bool truncated = false;
};

struct JobManagerOptions {
    size_t max_output_bytes = 1024 * 1024;
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::seconds retention{3600};
    size_t max_retained = 100;
};

// Owns every process started in background mode. One monitor thread per job
// runs the same supervision loop as foreground execution and is the only
// writer of that job's status and output. The table itself is guarded by a
// shared mutex: launches, updates and removals are exclusive, status and
// list queries share it.
class BackgroundJobManager {
public:
    explicit BackgroundJobManager(JobManagerOptions options);
    ~BackgroundJobManager();

    BackgroundJobManager(const BackgroundJobManager&) = delete;
    BackgroundJobManager& operator=(const BackgroundJobManager&) = delete;

    // Start the command and return its job id without waiting.
    // Throws ExecError(ExecutionFailure) if it cannot be started.
    std::string launch(const Command& command, const SandboxPath& cwd,
                       std::chrono::milliseconds timeout);

    // Point-in-time copy; nullopt if the id is unknown or evicted.
    std::optional<JobSnapshot> status(const std::string& job_id) const;

    // Graceful-then-forceful termination; waits for the job to settle.
    // Finished jobs are left as they are. False if the id is unknown.
    bool terminate(const std::string& job_id);

    // Terminate if needed, then drop the job. False if the id is unknown.
    bool remove(const std::string& job_id);

    // Summaries in launch order
    std::vector<JobSummary> list();

    // Drop finished jobs past the retention window or over the retained cap.
    // Returns the number evicted.
    size_t evict_expired();

    // Terminate and reap every job; further launches are refused.
    void shutdown();

    size_t running_count() const;

private:
    struct Job {
        uint64_t seq = 0;
        std::string id;
        std::string command;
        pid_t pid = 0;
        uint64_t started_at = 0;
        std::chrono::steady_clock::time_point start;
        std::chrono::steady_clock::time_point finished;
        JobStatus status = JobStatus::Running;
        OutputBuffer out;
        OutputBuffer err;
        std::optional<int> exit_code;
        int term_signal = 0;
        std::atomic<bool> stop_requested{false};
        std::thread monitor;

        Job(size_t capacity)
            : out(capacity, OutputBuffer::Overflow::KeepTail)
            , err(capacity, OutputBuffer::Overflow::KeepTail) {}
    };

    void monitor(std::shared_ptr<Job> job, std::unique_ptr<ProcessHandle> proc,
                 std::chrono::milliseconds timeout);
    std::shared_ptr<Job> find_locked(const std::string& job_id) const;
    JobSummary summarize_locked(const Job& job) const;
    std::vector<std::shared_ptr<Job>> collect_expired_locked();
    static void join_all(std::vector<std::shared_ptr<Job>>& jobs);

    JobManagerOptions options_;
    mutable std::shared_mutex mutex_;
    std::condition_variable_any settled_;
    std::map<uint64_t, std::shared_ptr<Job>> jobs_;
    uint64_t next_seq_ = 1;
    bool shutting_down_ = false;
};

// "job-<n>" <-> n
std::string format_job_id(uint64_t seq);
std::optional<uint64_t> parse_job_id(const std::string& job_id);

} // namespace mcpexec
