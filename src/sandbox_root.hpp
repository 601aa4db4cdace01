#pragma once
#include <filesystem>
#include <string>

namespace mcpexec {

// An absolute path proven to lie inside the sandbox root. Only SandboxRoot
// can construct one.
class SandboxPath {
public:
    const std::filesystem::path& path() const { return absolute_; }
    std::string string() const { return absolute_.string(); }

    // Root-relative form for responses ("." for the root itself)
    std::string relative() const;

private:
    friend class SandboxRoot;
    SandboxPath(std::filesystem::path absolute, std::filesystem::path relative)
        : absolute_(std::move(absolute)), relative_(std::move(relative)) {}

    std::filesystem::path absolute_;
    std::filesystem::path relative_;
};

class SandboxRoot {
public:
    // Creates the directory if absent and canonicalizes it.
    // Throws ExecError(ExecutionFailure) if it cannot be created.
    explicit SandboxRoot(const std::string& root);

    // Resolve a user-supplied path. Throws ExecError(PathEscape) when the
    // normalized path (symlinks followed) lies outside the root.
    SandboxPath resolve(const std::string& raw_path) const;

    SandboxPath root() const;
    const std::filesystem::path& path() const { return root_; }

private:
    bool contains(const std::filesystem::path& candidate) const;

    std::filesystem::path root_;
};

} // namespace mcpexec
