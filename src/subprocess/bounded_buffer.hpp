#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace gradebox {

/// Cap-and-truncate capture buffer for one output stream.
/// Everything past ``capacity`` bytes is discarded, and the buffer remembers that it was.
class BoundedBuffer
{
public:
    explicit BoundedBuffer(std::size_t capacity)
        : capacity_{capacity} {}

    void append(std::string_view data) {
        total_seen_ += data.size();

        std::size_t room = capacity_ - data_.size();

        if (data.size() > room) {
            data = data.substr(0, room);
            truncated_ = true;
        }

        data_ += data;
    }

    const std::string& str() const noexcept { return data_; }

    std::string release() noexcept { return std::move(data_); }

    bool truncated() const noexcept { return truncated_; }

    std::size_t capacity() const noexcept { return capacity_; }

    /// Bytes offered to the buffer, kept or not
    std::size_t total_seen() const noexcept { return total_seen_; }

private:
    std::size_t capacity_;
    std::size_t total_seen_ = 0;
    bool truncated_ = false;
    std::string data_;
};

} // namespace gradebox
