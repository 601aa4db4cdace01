#pragma once
#include "sandbox_root.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mcpexec {

struct FileEntry {
    std::string name;
    std::string type; // "file", "directory", "symlink" or "other"
    uint64_t size = 0;
};

// File access confined to the sandbox. Only SandboxPath values are accepted,
// so every path has already been through SandboxRoot::resolve().
class FileStore {
public:
    explicit FileStore(uint64_t max_file_bytes);

    // Throws ExecError(NotFound) or ExecError(ValidationError) for
    // directories and files over the size limit.
    std::string read(const SandboxPath& path) const;

    // Creates parent directories. Returns bytes written.
    uint64_t write(const SandboxPath& path, const std::string& content) const;

    // Entries sorted by name; a file path lists just that file.
    std::vector<FileEntry> list(const SandboxPath& path) const;

private:
    uint64_t max_file_bytes_;
};

} // namespace mcpexec
