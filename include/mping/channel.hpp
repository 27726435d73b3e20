#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace mping {

/**
 * Unbounded FIFO channel for passing messages between threads.
 *
 * Any number of producers may push(); consumers block in pop() or
 * wait with a bound in pop_for(). push() never blocks beyond the
 * short critical section, so producers cannot deadlock on a slow
 * consumer. Items from a single producer are delivered in push order.
 */
template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty(); });
        return take_front();
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [this] { return !items_.empty(); }))
            return std::nullopt;
        return take_front();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (items_.empty())
            return std::nullopt;
        return take_front();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

private:
    // Caller holds mtx_ and has checked non-empty.
    T take_front() {
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

} // namespace mping
