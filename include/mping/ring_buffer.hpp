#pragma once
#include <cstddef>
#include <vector>

namespace mping {

/**
 * Fixed-capacity ring of the most recent values.
 * Pushing past capacity evicts the oldest element.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity = 0) : buf_(capacity) {}

    void push(const T& value) {
        if (buf_.empty()) return;
        buf_[head_] = value;
        head_ = (head_ + 1) % buf_.size();
        if (size_ < buf_.size()) ++size_;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return buf_.size(); }
    bool empty() const { return size_ == 0; }

    // Oldest -> newest.
    std::vector<T> values() const {
        std::vector<T> out;
        out.reserve(size_);
        if (size_ == 0) return out;

        const std::size_t start = (size_ < buf_.size()) ? 0 : head_;
        for (std::size_t i = 0; i < size_; ++i)
            out.push_back(buf_[(start + i) % buf_.size()]);
        return out;
    }

    /**
     * Reallocate at a new capacity, keeping the most recent
     * min(size(), capacity) values in order.
     */
    void resize(std::size_t capacity) {
        if (capacity == buf_.size()) return;

        std::vector<T> kept = values();
        if (kept.size() > capacity)
            kept.erase(kept.begin(), kept.end() - static_cast<std::ptrdiff_t>(capacity));

        buf_.assign(capacity, T{});
        head_ = 0;
        size_ = 0;
        for (const auto& v : kept) push(v);
    }

private:
    std::vector<T> buf_;
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};

} // namespace mping
