/**
 * Bounded worker pool for conversion and history runs.
 *
 * Each run owns its pool so the worker count can come from configuration
 * (ingest.workers, history.workers). Tasks are taken from one FIFO queue;
 * the destructor drains the queue before joining, so every submitted task
 * runs exactly once and its future is always satisfied.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace regmetrics {

class ThreadPool {
public:
    using Task = std::function<void()>;

    // 0 selects std::thread::hardware_concurrency()
    explicit ThreadPool(size_t num_threads = 0) : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::thread::hardware_concurrency();
        }
        num_threads_ = std::max(size_t(1), num_threads);

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push([task]() { (*task)(); });
        }
        cv_.notify_one();

        return result;
    }

    size_t num_threads() const { return num_threads_; }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

private:
    void worker_loop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;  // stop_ requested and nothing left to drain
                }
                task = std::move(queue_.front());
                queue_.pop();
            }
            task();
        }
    }

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::queue<Task> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace regmetrics
