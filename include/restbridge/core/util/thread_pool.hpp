/**
 * @file thread_pool.hpp
 * @brief Worker pool the HTTP transport runs procedure calls on.
 *
 * Keeps slow handlers off the event loop thread. Tasks are executed in FIFO order by
 * a fixed set of workers.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace restbridge {

    /**
     * @class ThreadPool
     * @brief Fixed-size FIFO thread pool.
     *
     * A task that throws is logged and dropped; the worker keeps running.
     */
    class ThreadPool {
    public:
        /**
         * @brief Constructor for ThreadPool.
         * @param thread_count Number of worker threads to create. If 0, uses hardware concurrency.
         */
        explicit ThreadPool(size_t thread_count = 0);

        /**
         * @brief Destructor for ThreadPool.
         *
         * Drains the queue and joins the workers.
         */
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a task.
         * @param task Function to execute
         * @throws std::runtime_error if the pool has been stopped
         */
        void add(std::function<void()> task);

        /**
         * @brief Stop accepting tasks, run the queued ones and join the workers.
         */
        void join();

        size_t getThreadCount() const { return thread_count_; }

        /**
         * @brief Get the number of queued tasks not yet picked up by a worker.
         */
        size_t getPendingTaskCount() const;

        bool isStopped() const { return stop_; }

    private:
        void workerFunction();

        std::vector<std::thread> threads_;             ///< Worker threads
        size_t thread_count_ = 0;                      ///< Worker count fixed at construction
        std::queue<std::function<void()>> tasks_;      ///< Task queue
        mutable std::mutex queue_mutex_;               ///< Guards tasks_ and stop_ transitions
        std::condition_variable condition_;            ///< Signals new tasks or stop
        std::atomic<bool> stop_;                       ///< Stop flag
    };

} // namespace restbridge
