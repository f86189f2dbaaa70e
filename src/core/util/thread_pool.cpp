/**
 * @file thread_pool.cpp
 * @brief Implementation of the ThreadPool class.
 */
#include "siweauth/core/util/thread_pool.hpp"
#include "siweauth/core/util/logger.hpp"

namespace siweauth {

    ThreadPool::ThreadPool(std::size_t threadCount) {
        if (threadCount == 0) {
            threadCount = std::thread::hardware_concurrency();
            if (threadCount == 0) threadCount = 2;
        }
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i)
            workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    void ThreadPool::enqueue(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (stopping_)
                throw std::runtime_error("ThreadPool is stopped");
            jobs_.push(std::move(job));
        }
        cv_.notify_one();
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mx_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        workers_.clear();
    }

    std::size_t ThreadPool::pendingTasks() const {
        std::lock_guard<std::mutex> lock(mx_);
        return jobs_.size();
    }

    void ThreadPool::workerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mx_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (stopping_ && jobs_.empty()) return;
                job = std::move(jobs_.front());
                jobs_.pop();
            }

            // packaged_task routes exceptions into the future; anything reaching
            // here came from a raw job and is only logged.
            try {
                job();
            } catch (const std::exception& ex) {
                LOG_ERROR("[ThreadPool] task threw: " + std::string(ex.what()));
            }
        }
    }

} // namespace siweauth
