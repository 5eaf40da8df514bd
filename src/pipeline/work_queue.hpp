#pragma once

#include <polygrader/common/class_traits.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace polygrader {

/// Queue of pending work shared by a pool of workers. Workers take items until it runs dry.
template <typename T>
class WorkQueue : NonMovable
{
public:
    void push(T item) {
        std::scoped_lock lock{mutex_};
        queue_.push(std::move(item));
    }

    /// The item at the head of the queue, or nothing if the queue is empty
    std::optional<T> try_pop() {
        std::scoped_lock lock{mutex_};

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();

        return item;
    }

    std::size_t size() const {
        std::scoped_lock lock{mutex_};
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::queue<T> queue_;
};

} // namespace polygrader
