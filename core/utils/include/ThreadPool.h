#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ParaCopy {

    /**
     * @brief Fixed-size worker thread pool.
     *
     * Used via composition (the Dispatcher runs one long-lived worker loop
     * per thread on it). Tasks posted after shutdown() are dropped.
     */
    class ThreadPool {
    public:
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueue a task for execution.
         * @return std::future that becomes ready when the task finishes and
         *         rethrows anything the task threw.
         */
        template<typename F>
        std::future<void> enqueue(F&& func) {
            using TaskType = std::packaged_task<void()>;

            auto task = std::make_shared<TaskType>(std::forward<F>(func));
            std::future<void> fut = task->get_future();

            post([task]() {
                (*task)();
            });

            return fut;
        }

        std::size_t size() const { return workers_.size(); }

        /**
         * @brief Gracefully stop all workers after draining the queue.
         */
        void shutdown();

    private:
        void workerLoop();
        void post(std::function<void()> task);

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
    };

} // namespace ParaCopy
