#include "sandbox_root.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace mcpexec {

std::string SandboxPath::relative() const {
    if (relative_.empty()) return ".";
    return relative_.string();
}

SandboxRoot::SandboxRoot(const std::string& root) {
    fs::path requested(expand_home(root));
    if (requested.empty()) {
        throw ExecError(ErrorKind::ExecutionFailure, "Sandbox root is not configured");
    }

    std::error_code ec;
    fs::create_directories(requested, ec);
    if (ec) {
        throw ExecError(ErrorKind::ExecutionFailure,
                        "Failed to create sandbox root " + requested.string() + ": " + ec.message());
    }

    root_ = fs::canonical(requested, ec);
    if (ec) {
        throw ExecError(ErrorKind::ExecutionFailure,
                        "Failed to resolve sandbox root " + requested.string() + ": " + ec.message());
    }
    if (!fs::is_directory(root_)) {
        throw ExecError(ErrorKind::ExecutionFailure,
                        "Sandbox root is not a directory: " + root_.string());
    }
}

SandboxPath SandboxRoot::root() const {
    return SandboxPath(root_, fs::path());
}

bool SandboxRoot::contains(const fs::path& candidate) const {
    // Component-wise prefix check; "/sandbox-other" must not match "/sandbox"
    auto root_it = root_.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root_.end(); ++root_it, ++cand_it) {
        if (cand_it == candidate.end() || *cand_it != *root_it) {
            return false;
        }
    }
    return true;
}

SandboxPath SandboxRoot::resolve(const std::string& raw_path) const {
    if (raw_path.find('\0') != std::string::npos) {
        throw ExecError(ErrorKind::ValidationError, "Path contains a NUL byte");
    }

    std::string trimmed = trim(raw_path);
    if (trimmed.empty() || trimmed == ".") {
        return root();
    }

    fs::path raw(trimmed);
    fs::path joined = raw.is_absolute() ? raw : root_ / raw;

    // Follows symlinks for the existing prefix, normalizes the rest lexically.
    // A prefix that cannot be resolved (symlink loop, EACCES) is
    // rejected: lexical normalization would skip the symlinks the OS follows.
    std::error_code ec;
    fs::path normalized = fs::weakly_canonical(joined, ec);
    if (ec) {
        throw ExecError(ErrorKind::PathEscape,
                        "Path escapes the sandbox: " + trimmed + " (" + ec.message() + ")");
    }
    // weakly_canonical keeps a trailing separator as an empty last element
    if (!normalized.empty() && !normalized.has_filename()) {
        normalized = normalized.parent_path();
    }

    if (!contains(normalized)) {
        throw ExecError(ErrorKind::PathEscape,
                        "Path escapes the sandbox: " + trimmed);
    }

    fs::path relative = normalized.lexically_relative(root_);
    if (relative == ".") relative.clear();
    return SandboxPath(normalized, relative);
}

} // namespace mcpexec
