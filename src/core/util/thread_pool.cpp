/**
 * @file thread_pool.cpp
 * @brief Implementation of the ThreadPool class.
 *
 * @author Efecan
 * @date 2025
 */
#include "restbridge/core/util/thread_pool.hpp"
#include "restbridge/core/util/logger.hpp"
#include <stdexcept>

namespace restbridge {

    ThreadPool::ThreadPool(size_t thread_count)
        : stop_(false) {

        if (thread_count == 0) {
            thread_count = std::thread::hardware_concurrency();
            if (thread_count == 0) {
                thread_count = 2;
            }
        }

        thread_count_ = thread_count;
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back(&ThreadPool::workerFunction, this);
        }
    }

    ThreadPool::~ThreadPool() {
        join();
    }

    void ThreadPool::add(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            tasks_.emplace(std::move(task));
        }
        condition_.notify_one();
    }

    void ThreadPool::join() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    size_t ThreadPool::getPendingTaskCount() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    void ThreadPool::workerFunction() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this] {
                    return stop_ || !tasks_.empty();
                });

                // queued tasks still run after stop
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }

            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("[ThreadPool] task failed: ") + e.what());
            } catch (...) {
                LOG_ERROR("[ThreadPool] task failed with a non-standard exception");
            }
        }
    }

} // namespace restbridge
