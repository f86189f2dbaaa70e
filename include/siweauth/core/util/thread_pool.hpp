/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to run blocking chain reads concurrently.
 *
 * Group membership checks are independent, read-only and I/O bound; the group
 * synchronizer submits one task per strategy and waits on the futures with a
 * deadline. Tasks that outlive the deadline keep running on their worker and
 * their result is discarded.
 */
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace siweauth {

    /**
     * @class ThreadPool
     * @brief Thread pool for asynchronous task execution.
     */
    class ThreadPool {
    public:
        /**
         * @brief Start the workers.
         * @param threadCount Number of worker threads. If 0, uses hardware concurrency.
         */
        explicit ThreadPool(std::size_t threadCount = 0);

        /**
         * @brief Drains the queue and joins all workers.
         */
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a callable and obtain a future for its result.
         *
         * Exceptions thrown by the callable are delivered through the future.
         * @throws std::runtime_error if the pool is shutting down
         */
        template<typename F>
        auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

        /**
         * @brief Stop accepting work, finish queued tasks and join the workers.
         */
        void shutdown();

        std::size_t threadCount() const { return workers_.size(); }

        /**
         * @brief Number of tasks queued but not yet picked up by a worker.
         */
        std::size_t pendingTasks() const;

    private:
        void enqueue(std::function<void()> job);
        void workerLoop();

        std::vector<std::thread>          workers_;
        std::queue<std::function<void()>> jobs_;
        mutable std::mutex                mx_;
        std::condition_variable           cv_;
        bool                              stopping_{ false };
    };

    template<typename F>
    auto ThreadPool::submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        auto fut = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return fut;
    }

} // namespace siweauth
