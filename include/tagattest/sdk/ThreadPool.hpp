#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <functional>
#include <future>
#include <atomic>
#include <exception>
#include <memory>
#include <algorithm>
#include <vector>

namespace tagattest {
namespace sdk {

/**
 * @brief Fixed-size worker pool with task priorities
 *
 * Used to hash wide tree levels in parallel. Tasks receive their own
 * disjoint output ranges, so no task needs a lock of its own.
 */
class ThreadPool {
public:
    enum class Priority {
        LOW,
        HIGH
    };

    struct Task {
        std::function<void()> function;
        Priority priority;
        uint64_t sequence;

        // Higher priority first, then FIFO
        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    explicit ThreadPool(size_t thread_count = constants::DEFAULT_THREAD_POOL_SIZE);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task with priority
    template<typename F, typename... Args>
    auto enqueue(Priority priority, F&& f, Args&&... args)
        -> std::future<decltype(f(args...))> {
        using return_type = decltype(f(args...));

        auto task_promise = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task_promise->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            if (!running_) {
                throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
            }

            tasks_.push({
                [task_promise]() { (*task_promise)(); },
                priority,
                next_sequence_++
            });
        }

        condition_.notify_one();
        return result;
    }

    /**
     * @brief Run fn(begin, end) over [0, count) split into contiguous chunks
     *
     * Blocks until every chunk has finished. The first exception thrown by
     * a chunk is rethrown here after all chunks complete.
     */
    template<typename F>
    void parallel_for(size_t count, size_t min_chunk, F&& fn) {
        if (count == 0) {
            return;
        }
        min_chunk = std::max<size_t>(min_chunk, 1);
        size_t chunks = std::min(workers_.size(), (count + min_chunk - 1) / min_chunk);
        if (chunks <= 1) {
            fn(size_t{0}, count);
            return;
        }

        size_t chunk_size = (count + chunks - 1) / chunks;
        std::vector<std::future<void>> pending;
        pending.reserve(chunks);
        for (size_t begin = 0; begin < count; begin += chunk_size) {
            size_t end = std::min(count, begin + chunk_size);
            pending.push_back(enqueue(Priority::HIGH, [&fn, begin, end]() { fn(begin, end); }));
        }

        std::exception_ptr first_error;
        for (auto& f : pending) {
            try {
                f.get();
            } catch (const std::exception&) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    size_t get_queued_tasks() const;
    size_t get_active_tasks() const;
    size_t get_completed_tasks() const;
    size_t get_thread_count() const;

private:
    std::vector<std::thread> workers_;
    std::priority_queue<Task> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> running_{false};
    uint64_t next_sequence_ = 0;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> completed_tasks_{0};
};

} // namespace sdk
} // namespace tagattest
