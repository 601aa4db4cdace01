#include "process.hpp"
#include "errors.hpp"
#include "output_buffer.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace mcpexec {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr size_t kReadChunk = 65536;

// Written by the child to the status pipe when it cannot reach exec
struct StartFailure {
    int stage; // 0 = chdir, 1 = exec
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

[[noreturn]] void child_fail(int status_fd, int stage) {
    StartFailure failure{stage, errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────────

ProcessHandle::ProcessHandle(pid_t pid, int out_fd, int err_fd)
    : pid_(pid), out_fd_(out_fd), err_fd_(err_fd)
{}

ProcessHandle::~ProcessHandle() {
    if (!reaped_) {
        signal_group(SIGKILL);
        wait();
    }
    close_fd(out_fd_);
    close_fd(err_fd_);
}

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const Command& command,
                                                    const std::string& cwd) {
    if (command.argv.empty()) {
        throw ExecError(ErrorKind::ValidationError, "Empty command");
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* dir = cwd.c_str();

    // Close-on-exec everywhere: concurrently spawned children must not
    // inherit each other's pipe ends
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        for (int* p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw ExecError(ErrorKind::ExecutionFailure,
                        std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int* p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw ExecError(ErrorKind::ExecutionFailure,
                        std::string("Failed to fork process: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own session so the whole tree shares one process group
        ::setsid();

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (::chdir(dir) != 0) child_fail(status_pipe[1], 0);
        ::execvp(argv[0], argv.data());
        child_fail(status_pipe[1], 1);
    }

    // Parent
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(status_pipe[1]);

    // EOF here means exec succeeded (the status pipe was close-on-exec)
    StartFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    auto handle = std::unique_ptr<ProcessHandle>(
        new ProcessHandle(pid, out_pipe[0], err_pipe[0]));

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        handle->wait();
        if (failure.stage == 0) {
            throw ExecError(ErrorKind::ExecutionFailure,
                            "Failed to enter working directory " + cwd + ": " +
                            std::strerror(failure.error));
        }
        throw ExecError(ErrorKind::ExecutionFailure,
                        "Failed to start '" + command.argv[0] + "': " +
                        std::strerror(failure.error));
    }

    return handle;
}

size_t ProcessHandle::read_ready(int wait_ms, const OutputSink& sink) {
    std::array<struct pollfd, 2> pfds{};
    std::array<int*, 2> owners{};
    nfds_t count = 0;
    for (int* fd : {&out_fd_, &err_fd_}) {
        if (*fd >= 0) {
            pfds[count].fd = *fd;
            pfds[count].events = POLLIN;
            owners[count] = fd;
            ++count;
        }
    }

    if (count == 0) {
        if (wait_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        return 0;
    }

    int ret = ::poll(pfds.data(), count, wait_ms);
    if (ret <= 0) return 0; // timeout, or EINTR: the caller loops

    std::string out;
    std::string err;
    std::array<char, kReadChunk> buffer;
    for (nfds_t i = 0; i < count; ++i) {
        if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) == 0) continue;

        ssize_t got = ::read(*owners[i], buffer.data(), buffer.size());
        if (got > 0) {
            std::string& target = (owners[i] == &out_fd_) ? out : err;
            target.append(buffer.data(), static_cast<size_t>(got));
        } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
            close_fd(*owners[i]);
        }
    }

    size_t total = out.size() + err.size();
    if (total > 0 && sink) sink(out, err);
    return total;
}

bool ProcessHandle::pump(int wait_ms, const OutputSink& sink) {
    read_ready(wait_ms, sink);
    return out_fd_ >= 0 || err_fd_ >= 0;
}

void ProcessHandle::drain(const OutputSink& sink) {
    // Buffered pipe data outlives its writers; stop at EOF or when nothing
    // more is immediately available
    while (read_ready(0, sink) > 0) {
    }
}

bool ProcessHandle::try_reap() {
    if (reaped_) return true;
    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, WNOHANG);
    } while (ret < 0 && errno == EINTR);

    if (ret == pid_) {
        status_ = status;
        reaped_ = true;
    } else if (ret < 0) {
        // ECHILD: someone else reaped it; nothing left to wait for
        reaped_ = true;
    }
    return reaped_;
}

void ProcessHandle::wait() {
    if (reaped_) return;
    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret == pid_) status_ = status;
    reaped_ = true;
}

void ProcessHandle::signal_group(int sig) {
    if (pid_ <= 0) return;
    if (::killpg(pid_, sig) != 0 && !reaped_) {
        // Group not formed yet or already gone; the leader may still exist
        ::kill(pid_, sig);
    }
}

void ProcessHandle::terminate(std::chrono::milliseconds grace, const OutputSink& sink) {
    if (!reaped_) {
        signal_group(SIGTERM);
        auto until = std::chrono::steady_clock::now() + grace;
        while (!try_reap()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= until) break;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
            pump(static_cast<int>(std::max<int64_t>(1, std::min(left, kPollInterval).count())), sink);
        }
        if (!reaped_) {
            signal_group(SIGKILL);
            wait();
        }
    }
    finish(sink);
}

void ProcessHandle::finish(const OutputSink& sink) {
    signal_group(SIGKILL);
    drain(sink);
}

int ProcessHandle::exit_code() const {
    if (!reaped_) return -1;
    if (WIFEXITED(status_)) return WEXITSTATUS(status_);
    if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
    return -1;
}

int ProcessHandle::term_signal() const {
    if (reaped_ && WIFSIGNALED(status_)) return WTERMSIG(status_);
    return 0;
}

// ── Supervision ──────────────────────────────────────────────────

SuperviseOutcome supervise(ProcessHandle& proc,
                           std::chrono::steady_clock::time_point deadline,
                           std::chrono::milliseconds grace,
                           const std::atomic<bool>* stop,
                           const OutputSink& sink) {
    while (true) {
        if (proc.try_reap()) {
            proc.finish(sink);
            return SuperviseOutcome::Exited;
        }
        if (stop && stop->load()) {
            proc.terminate(grace, sink);
            return SuperviseOutcome::Stopped;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            proc.terminate(grace, sink);
            return SuperviseOutcome::TimedOut;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto wait = std::max<int64_t>(1, std::min(left, kPollInterval).count());
        proc.pump(static_cast<int>(wait), sink);
    }
}

// ── ProcessExecutor ──────────────────────────────────────────────

ProcessExecutor::ProcessExecutor(size_t max_output_bytes, std::chrono::milliseconds kill_grace)
    : max_output_bytes_(max_output_bytes), kill_grace_(kill_grace)
{}

ExecutionResult ProcessExecutor::run(const Command& command,
                                     const SandboxPath& cwd,
                                     std::chrono::milliseconds timeout,
                                     const std::atomic<bool>* cancel) const {
    auto start = std::chrono::steady_clock::now();
    auto proc = ProcessHandle::spawn(command, cwd.string());

    OutputBuffer out(max_output_bytes_, OutputBuffer::Overflow::KeepHead);
    OutputBuffer err(max_output_bytes_, OutputBuffer::Overflow::KeepHead);
    auto sink = [&out, &err](const std::string& o, const std::string& e) {
        out.append(o);
        err.append(e);
    };

    auto outcome = supervise(*proc, start + timeout, kill_grace_, cancel, sink);

    ExecutionResult result;
    result.exit_code = proc->exit_code();
    result.term_signal = proc->term_signal();
    result.stdout_data = out.str();
    result.stderr_data = err.str();
    result.truncated = out.truncated() || err.truncated();
    result.timed_out = outcome == SuperviseOutcome::TimedOut;
    result.cancelled = outcome == SuperviseOutcome::Stopped;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

} // namespace mcpexec
