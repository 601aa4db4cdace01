#include <catch2/catch_test_macros.hpp>
#include "process.hpp"
#include "errors.hpp"
#include "process_test_util.hpp"
#include <atomic>
#include <future>

using namespace mcpexec;
using namespace std::chrono_literals;

namespace {

struct ProcessFixture {
    std::string dir = make_temp_dir("mcpexec_process");
    SandboxRoot sandbox{dir};
    ProcessExecutor executor{1024 * 1024, 200ms};

    ~ProcessFixture() { std::filesystem::remove_all(dir); }

    ExecutionResult sh(const std::string& script, std::chrono::milliseconds timeout = 10s) {
        return executor.run(shell_command("/bin/sh", script), sandbox.root(), timeout);
    }
};

} // namespace

// ── Normal completion ────────────────────────────────────────────

TEST_CASE("ProcessExecutor: captures stdout and exit code", "[process]") {
    ProcessFixture f;
    auto r = f.sh("echo hello");
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.stdout_data == "hello\n");
    REQUIRE(r.stderr_data.empty());
    REQUIRE_FALSE(r.timed_out);
    REQUIRE_FALSE(r.truncated);
    REQUIRE_FALSE(r.cancelled);
}

TEST_CASE("ProcessExecutor: stderr is separate and non-zero exit is a result", "[process]") {
    ProcessFixture f;
    auto r = f.sh("echo out; echo err >&2; exit 3");
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.stdout_data == "out\n");
    REQUIRE(r.stderr_data == "err\n");
    REQUIRE(r.term_signal == 0);
}

TEST_CASE("ProcessExecutor: runs in the requested directory", "[process]") {
    ProcessFixture f;
    std::filesystem::create_directories(f.sandbox.path() / "work");
    auto r = f.executor.run(shell_command("/bin/sh", "pwd"), f.sandbox.resolve("work"), 5s);
    REQUIRE(r.stdout_data == (f.sandbox.path() / "work").string() + "\n");
}

TEST_CASE("ProcessExecutor: stdin is empty", "[process]") {
    ProcessFixture f;
    auto r = f.sh("cat; echo done");
    REQUIRE(r.stdout_data == "done\n");
    REQUIRE_FALSE(r.timed_out);
}

TEST_CASE("ProcessExecutor: death by signal reported as 128 + signal", "[process]") {
    ProcessFixture f;
    auto r = f.sh("kill -9 $$");
    REQUIRE(r.term_signal == SIGKILL);
    REQUIRE(r.exit_code == 128 + SIGKILL);
}

// ── Start failures ───────────────────────────────────────────────

TEST_CASE("ProcessHandle: missing binary is ExecutionFailure", "[process]") {
    ProcessFixture f;
    Command cmd{{"mcpexec-no-such-interpreter", "x"}, "mcpexec-no-such-interpreter x"};
    bool threw = false;
    try {
        f.executor.run(cmd, f.sandbox.root(), 5s);
    } catch (const ExecError& e) {
        threw = true;
        REQUIRE(e.kind() == ErrorKind::ExecutionFailure);
        REQUIRE(std::string(e.what()).find("mcpexec-no-such-interpreter") != std::string::npos);
    }
    REQUIRE(threw);
}

TEST_CASE("ProcessHandle: empty argv is ValidationError", "[process]") {
    bool threw = false;
    try {
        ProcessHandle::spawn(Command{}, "/");
    } catch (const ExecError& e) {
        threw = true;
        REQUIRE(e.kind() == ErrorKind::ValidationError);
    }
    REQUIRE(threw);
}

// ── Timeout ──────────────────────────────────────────────────────

TEST_CASE("ProcessExecutor: timeout kills the process within bounds", "[process]") {
    ProcessFixture f;
    auto start = std::chrono::steady_clock::now();
    auto r = f.sh("echo started; sleep 30", 300ms);
    auto took = std::chrono::steady_clock::now() - start;

    REQUIRE(r.timed_out);
    REQUIRE(r.term_signal != 0);
    REQUIRE(r.stdout_data == "started\n");
    // timeout + grace + scheduling slack
    REQUIRE(took < 3s);
}

TEST_CASE("ProcessExecutor: SIGTERM-ignoring process is force-killed", "[process]") {
    ProcessFixture f;
    auto start = std::chrono::steady_clock::now();
    auto r = f.sh("trap '' TERM; sleep 30", 200ms);
    auto took = std::chrono::steady_clock::now() - start;

    REQUIRE(r.timed_out);
    REQUIRE(r.term_signal == SIGKILL);
    REQUIRE(took < 3s);
}

TEST_CASE("ProcessExecutor: timeout leaves no descendants behind", "[process]") {
    ProcessFixture f;
    auto r = f.sh("sleep 30 & echo $!; wait", 300ms);
    REQUIRE(r.timed_out);

    pid_t child = static_cast<pid_t>(std::stol(r.stdout_data));
    REQUIRE(child > 0);
    REQUIRE(wait_for_exit(child));
}

TEST_CASE("ProcessExecutor: cancellation flag stops the run", "[process]") {
    ProcessFixture f;
    std::atomic<bool> cancel{true};
    auto r = f.executor.run(shell_command("/bin/sh", "sleep 30"), f.sandbox.root(), 10s, &cancel);
    REQUIRE(r.cancelled);
    REQUIRE_FALSE(r.timed_out);
    REQUIRE(r.elapsed < 3s);
}

// ── Truncation ───────────────────────────────────────────────────

TEST_CASE("ProcessExecutor: output capped at the ceiling", "[process]") {
    ProcessFixture f;
    ProcessExecutor small(1000, 200ms);
    auto r = small.run(shell_command("/bin/sh", "head -c 100000 /dev/zero | tr '\\0' a"),
                       f.sandbox.root(), 10s);
    REQUIRE(r.truncated);
    REQUIRE(r.stdout_data.size() <= 1000);
    REQUIRE(r.stdout_data == std::string(1000, 'a'));
    REQUIRE(r.exit_code == 0);
    REQUIRE_FALSE(r.timed_out);
}

// ── Concurrency ──────────────────────────────────────────────────

TEST_CASE("ProcessExecutor: concurrent runs keep outputs isolated", "[process]") {
    ProcessFixture f;
    std::vector<std::future<ExecutionResult>> runs;
    for (int i = 0; i < 6; ++i) {
        runs.push_back(std::async(std::launch::async, [&f, i] {
            return f.sh("for n in 1 2 3; do echo run-" + std::to_string(i) + "; sleep 0.05; done");
        }));
    }
    for (int i = 0; i < 6; ++i) {
        auto r = runs[static_cast<size_t>(i)].get();
        std::string line = "run-" + std::to_string(i) + "\n";
        REQUIRE(r.stdout_data == line + line + line);
        REQUIRE(r.exit_code == 0);
    }
}
