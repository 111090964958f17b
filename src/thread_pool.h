#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sniprun {

// Fixed set of threads draining a FIFO of tasks. stop() refuses new tasks,
// lets the queue run dry and joins the threads.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // False once the pool is stopping
    bool submit(std::function<void()> task);

    void stop();

    size_t active_count() const { return active_tasks_.load(); }
    size_t queued_count() const;
    size_t thread_count() const { return threads_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<size_t> active_tasks_{0};
};

} // namespace sniprun
