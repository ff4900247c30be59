#ifndef JANUS_CORE_BOUNDED_QUEUE_HPP
#define JANUS_CORE_BOUNDED_QUEUE_HPP

#include "core/non_copyable.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace core {
    // Fixed-capacity FIFO shared between one producer thread and one consumer
    // thread. push() never blocks: a full queue sheds its oldest element,
    // since stale audio and stale events are worth less than fresh ones.
    template <typename T>
    class BoundedQueue : private NonCopyable {
    public:
        explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        // Returns the number of elements dropped to make room (0 or 1).
        size_t push(T item) {
            size_t dropped = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return 0;
                }
                if (items_.size() >= capacity_) {
                    items_.pop_front();
                    ++dropped_;
                    dropped = 1;
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return dropped;
        }

        std::optional<T> pop(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) {
                return std::nullopt;
            }
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        std::optional<T> try_pop() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        size_t dropped() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return dropped_;
        }

        size_t capacity() const { return capacity_; }

    private:
        const size_t capacity_;
        std::deque<T> items_;
        size_t dropped_ = 0;
        bool closed_ = false;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };
}

#endif
