#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace LinkPreview {
    // Fixed-size worker pool for CPU-bound parse work.
    class ThreadPool {
    public:
        explicit ThreadPool(size_t num_threads);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        // Returns false once the pool is shutting down; the task is not run.
        bool enqueue(std::function<void()> task);

        size_t size() const { return threads_.size(); }
        size_t pending() const;

        // Runs the queued tasks, then joins the workers. Idempotent.
        void shutdown();

    private:
        void worker();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex mutex_;
        std::condition_variable condition_;
        bool stop_ = false;
    };
}
