#ifndef SLOTINGEST_CORE_PIPELINE_TASK_QUEUE_H
#define SLOTINGEST_CORE_PIPELINE_TASK_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace slotingest {

/**
 * @brief One unit of queued work.
 */
struct TaskItem {
    std::string name;
    std::function<void()> fn;
};

/**
 * TaskQueue - FIFO of pending tasks shared by executor workers
 *
 * pop() blocks until an item is available or the queue is shut down.
 * After shutdown, remaining items are still drained; pop() returns
 * nullopt once the queue is both shut down and empty.
 */
class TaskQueue {
   private:
    std::deque<TaskItem> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;

   public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * Push a task; returns false if the queue is shut down
     */
    bool push(TaskItem item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<TaskItem> pop(bool blocking = true) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (blocking) {
            cv_.wait(lock, [this] { return shutdown_ || !items_.empty(); });
        }
        if (items_.empty()) {
            return std::nullopt;
        }
        TaskItem item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        shutdown_ = false;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }
};

}  // namespace slotingest

#endif  // SLOTINGEST_CORE_PIPELINE_TASK_QUEUE_H
