#include "file_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mcpexec {

static FileEntry make_entry(const fs::path& path, const std::string& name) {
    FileEntry entry;
    entry.name = name;
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (ec) {
        entry.type = "other";
    } else if (fs::is_symlink(st)) {
        entry.type = "symlink";
    } else if (fs::is_directory(st)) {
        entry.type = "directory";
    } else if (fs::is_regular_file(st)) {
        entry.type = "file";
        auto size = fs::file_size(path, ec);
        if (!ec) entry.size = size;
    } else {
        entry.type = "other";
    }
    return entry;
}

FileStore::FileStore(uint64_t max_file_bytes)
    : max_file_bytes_(max_file_bytes)
{}

std::string FileStore::read(const SandboxPath& path) const {
    std::error_code ec;
    auto st = fs::status(path.path(), ec);
    if (ec || !fs::exists(st)) {
        throw ExecError(ErrorKind::NotFound, "File not found: " + path.relative());
    }
    if (fs::is_directory(st)) {
        throw ExecError(ErrorKind::ValidationError,
                        "Path is a directory: " + path.relative() + " (use list)");
    }
    // FIFOs, sockets and devices would block or never end
    if (!fs::is_regular_file(st)) {
        throw ExecError(ErrorKind::ValidationError, "Not a regular file: " + path.relative());
    }
    auto size = fs::file_size(path.path(), ec);
    if (!ec && size > max_file_bytes_) {
        throw ExecError(ErrorKind::ValidationError,
                        "File too large: " + path.relative() + " (" + std::to_string(size) +
                        " bytes, limit " + std::to_string(max_file_bytes_) + ")");
    }

    std::ifstream file(path.path(), std::ios::binary);
    if (!file.is_open()) {
        throw ExecError(ErrorKind::ExecutionFailure, "Failed to open file: " + path.relative());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

uint64_t FileStore::write(const SandboxPath& path, const std::string& content) const {
    if (content.size() > max_file_bytes_) {
        throw ExecError(ErrorKind::ValidationError,
                        "Content too large: " + std::to_string(content.size()) +
                        " bytes, limit " + std::to_string(max_file_bytes_));
    }

    std::error_code ec;
    auto st = fs::status(path.path(), ec);
    if (fs::is_directory(st)) {
        throw ExecError(ErrorKind::ValidationError, "Path is a directory: " + path.relative());
    }
    if (fs::exists(st) && !fs::is_regular_file(st)) {
        throw ExecError(ErrorKind::ValidationError, "Not a regular file: " + path.relative());
    }

    const fs::path& target = path.path();
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ExecError(ErrorKind::ExecutionFailure,
                            "Failed to create directories: " + ec.message());
        }
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw ExecError(ErrorKind::ExecutionFailure,
                        "Failed to open file for writing: " + path.relative());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        throw ExecError(ErrorKind::ExecutionFailure, "Failed to write to file: " + path.relative());
    }
    return content.size();
}

std::vector<FileEntry> FileStore::list(const SandboxPath& path) const {
    std::error_code ec;
    auto st = fs::status(path.path(), ec);
    if (ec || !fs::exists(st)) {
        throw ExecError(ErrorKind::NotFound, "Path not found: " + path.relative());
    }

    std::vector<FileEntry> entries;
    if (!fs::is_directory(st)) {
        entries.push_back(make_entry(path.path(), path.path().filename().string()));
        return entries;
    }

    fs::directory_iterator it(path.path(), ec);
    if (ec) {
        throw ExecError(ErrorKind::ExecutionFailure,
                        "Failed to list " + path.relative() + ": " + ec.message());
    }
    for (const auto& dirent : it) {
        entries.push_back(make_entry(dirent.path(), dirent.path().filename().string()));
    }
    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; });
    return entries;
}

} // namespace mcpexec
