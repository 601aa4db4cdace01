#pragma once
#include <stdexcept>
#include <string>

namespace mcpexec {

// Failure kinds surfaced to callers. Timeouts and truncation are not errors;
// they are flags on results.
enum class ErrorKind {
    PathEscape,
    UnsupportedLanguage,
    ValidationError,
    NotFound,
    ExecutionFailure,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PathEscape:          return "PathEscape";
        case ErrorKind::UnsupportedLanguage: return "UnsupportedLanguage";
        case ErrorKind::ValidationError:     return "ValidationError";
        case ErrorKind::NotFound:            return "NotFound";
        case ErrorKind::ExecutionFailure:    return "ExecutionFailure";
    }
    return "ExecutionFailure";
}

class ExecError : public std::runtime_error {
public:
    ExecError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace mcpexec
