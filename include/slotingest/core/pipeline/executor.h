#ifndef SLOTINGEST_CORE_PIPELINE_EXECUTOR_H
#define SLOTINGEST_CORE_PIPELINE_EXECUTOR_H

#include <slotingest/core/pipeline/task_queue.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace slotingest {

/**
 * Fixed pool of workers pulling named tasks from a shared TaskQueue.
 *
 * submit() hands back a std::future carrying the task's result or its
 * exception. shutdown() lets queued tasks finish before joining.
 */
class Executor {
   private:
    TaskQueue queue_;
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> running_{false};
    std::size_t num_threads_;

    std::atomic<std::size_t> tasks_completed_{0};

   public:
    /**
     * Constructor
     * @param num_threads Number of worker threads (0 = hardware_concurrency)
     */
    explicit Executor(std::size_t num_threads = 0);

    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(Executor&&) = delete;

    /**
     * Start the executor (spawn worker threads)
     */
    void start();

    /**
     * Shutdown the executor gracefully; queued tasks are drained first
     */
    void shutdown();

    /**
     * Queue a callable and get a future for its result
     *
     * @throws std::runtime_error if the executor is not running
     */
    template <typename F>
    std::future<std::invoke_result_t<F&>> submit(std::string name, F&& fn) {
        using R = std::invoke_result_t<F&>;
        auto task =
            std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        enqueue(TaskItem{std::move(name), [task]() { (*task)(); }});
        return future;
    }

    bool is_running() const { return running_.load(); }

    std::size_t get_num_threads() const { return num_threads_; }

    std::size_t get_tasks_completed() const { return tasks_completed_.load(); }

   private:
    void enqueue(TaskItem item);

    void worker_thread();

    void execute_task(TaskItem& item);
};

}  // namespace slotingest

#endif  // SLOTINGEST_CORE_PIPELINE_EXECUTOR_H
