#pragma once
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <sys/types.h>
#include <unistd.h>

// Shared test helpers: temp directories and process liveness checks

inline std::string make_temp_dir(const char* prefix) {
    auto path = std::filesystem::temp_directory_path() / (std::string(prefix) + "_XXXXXX");
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// True while pid names a live, non-zombie process
inline bool process_alive(pid_t pid) {
    if (::kill(pid, 0) != 0) return errno != ESRCH;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content((std::istreambuf_iterator<char>(stat)),
                        std::istreambuf_iterator<char>());
    auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= content.size()) return false;
    return content[close_paren + 2] != 'Z';
}

// Orphans are reaped by init asynchronously; allow it a moment
inline bool wait_for_exit(pid_t pid, std::chrono::milliseconds limit = std::chrono::seconds(3)) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (process_alive(pid)) {
        if (std::chrono::steady_clock::now() >= until) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}
