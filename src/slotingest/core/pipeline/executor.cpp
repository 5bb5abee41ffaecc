#include <slotingest/core/common/logging.h>
#include <slotingest/core/pipeline/executor.h>

#include <exception>
#include <stdexcept>

namespace slotingest {

Executor::Executor(std::size_t num_threads)
    : num_threads_(num_threads == 0 ? std::thread::hardware_concurrency()
                                    : num_threads) {
    if (num_threads_ == 0) {
        num_threads_ = 1;
    }
}

Executor::~Executor() { shutdown(); }

void Executor::start() {
    if (running_.exchange(true)) {
        return;
    }
    queue_.reset();
    worker_threads_.reserve(num_threads_);
    for (std::size_t i = 0; i < num_threads_; ++i) {
        worker_threads_.emplace_back([this]() { worker_thread(); });
    }
    SLOTINGEST_LOG_DEBUG("Started %zu fetch worker(s)", num_threads_);
}

void Executor::shutdown() {
    if (!running_) {
        return;
    }

    queue_.shutdown();
    for (auto& worker : worker_threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    worker_threads_.clear();
    running_ = false;
    SLOTINGEST_LOG_DEBUG("Stopped fetch workers after %zu task(s)",
                         tasks_completed_.load());
}

void Executor::enqueue(TaskItem item) {
    if (!running_) {
        throw std::runtime_error("Executor is not running");
    }
    if (!queue_.push(std::move(item))) {
        throw std::runtime_error("Executor is shutting down");
    }
}

void Executor::worker_thread() {
    // pop() blocks until work arrives and returns nullopt once the queue
    // is shut down and drained
    while (auto item = queue_.pop(/* blocking */ true)) {
        if (item->fn) {
            execute_task(*item);
        }
    }
}

void Executor::execute_task(TaskItem& item) {
    // Task failures are captured by the packaged_task and surface through
    // the caller's future; anything escaping here is an executor bug.
    try {
        SLOTINGEST_LOG_TRACE("Running task '%s'", item.name.c_str());
        item.fn();
    } catch (const std::exception& e) {
        SLOTINGEST_LOG_ERROR("Task '%s' escaped with exception: %s",
                             item.name.c_str(), e.what());
    }
    ++tasks_completed_;
}

}  // namespace slotingest
