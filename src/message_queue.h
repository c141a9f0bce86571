#pragma once

#include <deque>
#include <mutex>

namespace skyshare {

/**
 * Unbounded multi-producer / multi-consumer queue.
 * Neither push nor try_pop ever waits for the other side.
 */
template <typename T>
class MessageQueue {
public:
    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(item));
    }

    /**
     * Pop the oldest item.
     * @return false if the queue is empty
     */
    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> items_;
};

} // namespace skyshare
