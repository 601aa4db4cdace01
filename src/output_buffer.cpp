#include "output_buffer.hpp"
#include <algorithm>

namespace mcpexec {

OutputBuffer::OutputBuffer(size_t capacity, Overflow mode)
    : capacity_(capacity), mode_(mode)
{}

void OutputBuffer::append(const char* data, size_t len) {
    if (len == 0) return;

    if (mode_ == Overflow::KeepHead) {
        size_t room = capacity_ > data_.size() ? capacity_ - data_.size() : 0;
        size_t take = std::min(room, len);
        data_.append(data, take);
        dropped_ += len - take;
        return;
    }

    // KeepTail: only the last capacity_ bytes of the incoming chunk can survive
    if (len >= capacity_) {
        dropped_ += data_.size() + (len - capacity_);
        data_.assign(data + (len - capacity_), capacity_);
        return;
    }
    size_t overflow = data_.size() + len > capacity_ ? data_.size() + len - capacity_ : 0;
    if (overflow > 0) {
        data_.erase(0, overflow);
        dropped_ += overflow;
    }
    data_.append(data, len);
}

} // namespace mcpexec
