#pragma once
#include <cstddef>
#include <string>

namespace mcpexec {

// Captured output with a hard size ceiling.
//   KeepHead: bytes past the ceiling are dropped (foreground runs).
//   KeepTail: oldest bytes are dropped so the newest output survives
//             (background jobs, which are polled while running).
class OutputBuffer {
public:
    enum class Overflow { KeepHead, KeepTail };

    OutputBuffer(size_t capacity, Overflow mode);

    void append(const char* data, size_t len);
    void append(const std::string& data) { append(data.data(), data.size()); }

    const std::string& str() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t capacity() const { return capacity_; }
    bool truncated() const { return dropped_ > 0; }
    size_t dropped() const { return dropped_; }

private:
    size_t capacity_;
    Overflow mode_;
    std::string data_;
    size_t dropped_ = 0;
};

} // namespace mcpexec
