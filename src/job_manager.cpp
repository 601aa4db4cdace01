#include "job_manager.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <system_error>

namespace mcpexec {

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Running:    return "running";
        case JobStatus::Exited:     return "exited";
        case JobStatus::Terminated: return "terminated";
        case JobStatus::TimedOut:   return "timed_out";
    }
    return "running";
}

std::string format_job_id(uint64_t seq) {
    return "job-" + std::to_string(seq);
}

std::optional<uint64_t> parse_job_id(const std::string& job_id) {
    const std::string prefix = "job-";
    if (job_id.size() <= prefix.size() || job_id.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    std::string digits = job_id.substr(prefix.size());
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoull(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

BackgroundJobManager::BackgroundJobManager(JobManagerOptions options)
    : options_(options)
{}

BackgroundJobManager::~BackgroundJobManager() {
    shutdown();
}

std::string BackgroundJobManager::launch(const Command& command, const SandboxPath& cwd,
                                         std::chrono::milliseconds timeout) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (shutting_down_) {
            throw ExecError(ErrorKind::ExecutionFailure, "Job manager is shutting down");
        }
    }
    evict_expired();

    auto job = std::make_shared<Job>(options_.max_output_bytes);
    job->command = command.display;
    job->started_at = epoch_seconds();
    job->start = std::chrono::steady_clock::now();

    auto proc = ProcessHandle::spawn(command, cwd.string());
    job->pid = proc->pid();

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (shutting_down_) {
            // proc goes out of scope here: group killed and reaped
            throw ExecError(ErrorKind::ExecutionFailure, "Job manager is shutting down");
        }
        job->seq = next_seq_++;
        job->id = format_job_id(job->seq);
        jobs_.emplace(job->seq, job);
        try {
            job->monitor = std::thread(&BackgroundJobManager::monitor, this, job,
                                       std::move(proc), timeout);
        } catch (const std::system_error& e) {
            jobs_.erase(job->seq);
            throw ExecError(ErrorKind::ExecutionFailure,
                            std::string("Failed to start job monitor: ") + e.what());
        }
    }

    std::cerr << ("[jobs] Launched " + job->id + " (pid " + std::to_string(job->pid) +
                  "): " + job->command + "\n");
    return job->id;
}

void BackgroundJobManager::monitor(std::shared_ptr<Job> job,
                                   std::unique_ptr<ProcessHandle> proc,
                                   std::chrono::milliseconds timeout) {
    auto sink = [this, &job](const std::string& out, const std::string& err) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        job->out.append(out);
        job->err.append(err);
    };

    JobStatus final_status = JobStatus::Terminated;
    try {
        auto outcome = supervise(*proc, job->start + timeout, options_.kill_grace,
                                 &job->stop_requested, sink);
        switch (outcome) {
            case SuperviseOutcome::Exited:   final_status = JobStatus::Exited; break;
            case SuperviseOutcome::TimedOut: final_status = JobStatus::TimedOut; break;
            case SuperviseOutcome::Stopped:  final_status = JobStatus::Terminated; break;
        }
    } catch (const std::exception& e) {
        std::cerr << ("[jobs] Monitor for " + job->id + " failed: " + e.what() + "\n");
        proc->terminate(options_.kill_grace, nullptr);
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        job->status = final_status;
        job->exit_code = proc->exit_code();
        job->term_signal = proc->term_signal();
        job->finished = std::chrono::steady_clock::now();
    }
    settled_.notify_all();

    std::cerr << ("[jobs] " + job->id + " " + job_status_name(final_status) +
                  " (exit " + std::to_string(proc->exit_code()) + ")\n");
}

std::shared_ptr<BackgroundJobManager::Job>
BackgroundJobManager::find_locked(const std::string& job_id) const {
    auto seq = parse_job_id(job_id);
    if (!seq) return nullptr;
    auto it = jobs_.find(*seq);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

JobSummary BackgroundJobManager::summarize_locked(const Job& job) const {
    JobSummary s;
    s.id = job.id;
    s.command = job.command;
    s.pid = job.pid;
    s.status = job.status;
    s.started_at = job.started_at;
    auto end = job.status == JobStatus::Running ? std::chrono::steady_clock::now() : job.finished;
    s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - job.start);
    s.exit_code = job.exit_code;
    s.term_signal = job.term_signal;
    return s;
}

std::optional<JobSnapshot> BackgroundJobManager::status(const std::string& job_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto job = find_locked(job_id);
    if (!job) return std::nullopt;

    JobSnapshot snap;
    static_cast<JobSummary&>(snap) = summarize_locked(*job);
    snap.stdout_data = job->out.str();
    snap.stderr_data = job->err.str();
    snap.truncated = job->out.truncated() || job->err.truncated();
    return snap;
}

bool BackgroundJobManager::terminate(const std::string& job_id) {
    std::shared_ptr<Job> job;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        job = find_locked(job_id);
        if (!job) return false;
        if (job->status != JobStatus::Running) return true;
        job->stop_requested.store(true);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool settled = settled_.wait_for(lock, options_.kill_grace + std::chrono::seconds(5),
                                     [&job] { return job->status != JobStatus::Running; });
    if (!settled) {
        std::cerr << ("[jobs] " + job->id + " did not settle after termination request\n");
    }
    return true;
}

bool BackgroundJobManager::remove(const std::string& job_id) {
    if (!terminate(job_id)) return false;

    std::shared_ptr<Job> job;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto seq = parse_job_id(job_id);
        auto it = seq ? jobs_.find(*seq) : jobs_.end();
        if (it == jobs_.end()) return true; // evicted concurrently
        job = it->second;
        jobs_.erase(it);
    }
    if (job->monitor.joinable()) job->monitor.join();
    return true;
}

std::vector<JobSummary> BackgroundJobManager::list() {
    evict_expired();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<JobSummary> result;
    result.reserve(jobs_.size());
    for (const auto& [seq, job] : jobs_) {
        result.push_back(summarize_locked(*job));
    }
    return result;
}

std::vector<std::shared_ptr<BackgroundJobManager::Job>>
BackgroundJobManager::collect_expired_locked() {
    auto now = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<Job>> expired;
    std::vector<std::shared_ptr<Job>> finished;

    for (auto it = jobs_.begin(); it != jobs_.end(); ) {
        const auto& job = it->second;
        if (job->status == JobStatus::Running) {
            ++it;
        } else if (now - job->finished >= options_.retention) {
            expired.push_back(job);
            it = jobs_.erase(it);
        } else {
            finished.push_back(job);
            ++it;
        }
    }

    if (finished.size() > options_.max_retained) {
        std::sort(finished.begin(), finished.end(),
                  [](const std::shared_ptr<Job>& a, const std::shared_ptr<Job>& b) {
                      return a->finished < b->finished;
                  });
        size_t excess = finished.size() - options_.max_retained;
        for (size_t i = 0; i < excess; ++i) {
            jobs_.erase(finished[i]->seq);
            expired.push_back(finished[i]);
        }
    }
    return expired;
}

void BackgroundJobManager::join_all(std::vector<std::shared_ptr<Job>>& jobs) {
    for (auto& job : jobs) {
        if (job->monitor.joinable()) job->monitor.join();
    }
}

size_t BackgroundJobManager::evict_expired() {
    std::vector<std::shared_ptr<Job>> expired;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        expired = collect_expired_locked();
    }
    join_all(expired);
    for (const auto& job : expired) {
        std::cerr << ("[jobs] Evicted " + job->id + "\n");
    }
    return expired.size();
}

void BackgroundJobManager::shutdown() {
    std::vector<std::shared_ptr<Job>> all;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        shutting_down_ = true;
        // Taken out of the table so no other path joins these monitors
        for (const auto& [seq, job] : jobs_) {
            job->stop_requested.store(true);
            all.push_back(job);
        }
        jobs_.clear();
    }
    if (all.empty()) return;

    std::cerr << ("[jobs] Shutting down " + std::to_string(all.size()) + " job(s)\n");
    // Monitors escalate, reap and record the final status before exiting
    join_all(all);
}

size_t BackgroundJobManager::running_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(),
        [](const auto& entry) { return entry.second->status == JobStatus::Running; }));
}

} // namespace mcpexec
