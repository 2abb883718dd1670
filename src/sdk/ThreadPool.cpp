#include "tagattest/sdk/ThreadPool.hpp"
#include "tagattest/sdk/SecureLogger.hpp"

namespace tagattest {
namespace sdk {

ThreadPool::ThreadPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }

    SecureLogger::instance().debug("Starting hash worker pool with " + std::to_string(thread_count) + " threads");
    running_ = true;

    try {
        for (size_t i = 0; i < thread_count; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    Task task;
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex_);

                        condition_.wait(lock, [this] {
                            return !tasks_.empty() || !running_;
                        });

                        // Drain remaining tasks before exiting
                        if (!running_ && tasks_.empty()) {
                            return;
                        }

                        task = tasks_.top();
                        tasks_.pop();
                        ++active_tasks_;
                    }

                    // packaged_task stores exceptions in its future
                    try {
                        task.function();
                    } catch (const std::exception& e) {
                        SecureLogger::instance().error("Worker task exception: " + std::string(e.what()));
                    }

                    --active_tasks_;
                    ++completed_tasks_;
                }
            });
        }
    } catch (const std::exception& e) {
        SecureLogger::instance().critical("Failed to start worker pool: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            running_ = false;
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
            worker.join();
        }
        throw;
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        running_ = false;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    SecureLogger::instance().debug("Hash worker pool stopped after " +
                                   std::to_string(completed_tasks_.load()) + " tasks");
}

size_t ThreadPool::get_queued_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

size_t ThreadPool::get_active_tasks() const {
    return active_tasks_;
}

size_t ThreadPool::get_completed_tasks() const {
    return completed_tasks_;
}

size_t ThreadPool::get_thread_count() const {
    return workers_.size();
}

} // namespace sdk
} // namespace tagattest
