#pragma once

#include "constants.h"
#include "result_aggregator.h"
#include "types.h"
#include "worker_pool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sniprun {

// Bounded FIFO of pending requests in front of the worker pool. One
// dispatcher thread hands requests to Ready workers in arrival order,
// never letting a session's later request overtake its earlier one.
class Scheduler {
public:
    struct Config {
        size_t max_queue_depth;
        std::chrono::milliseconds max_queue_wait;

        Config() :
            max_queue_depth(DEFAULT_MAX_QUEUE_DEPTH),
            max_queue_wait(DEFAULT_MAX_QUEUE_WAIT_MS) {}
    };

    // Called once per request when it reaches a terminal outcome.
    // `executed` is false when it never reached a worker.
    using CompletionHandler = std::function<void(const ExecutionRequest& request,
                                                 const ExecutionResult& result,
                                                 bool executed)>;

    Scheduler(WorkerPool& pool, ResultAggregator& aggregator, const Config& config = Config());
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();
    void stop();

    // Returns the 1-based queue position. Throws RejectedError(SERVICE_BUSY)
    // when the queue is full or stop() has been called.
    size_t enqueue(RequestPtr request);

    // Remove a pending request or kill a running one. False if unknown or
    // already finished.
    bool cancel(const std::string& request_id);

    std::optional<size_t> queue_position(const std::string& request_id) const;
    size_t queue_depth() const;

    void set_completion_handler(CompletionHandler handler);

private:
    void dispatch_loop();
    void finish(const ExecutionRequest& request, const ExecutionResult& result, bool executed);
    ExecutionResult unexecuted(const ExecutionRequest& request, Outcome outcome,
                               const std::string& message) const;

    WorkerPool& pool_;
    ResultAggregator& aggregator_;
    Config config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RequestPtr> pending_;
    bool wake_ = false;
    bool stopped_ = false;

    std::atomic<bool> running_{false};
    std::thread dispatcher_;

    std::mutex handler_mutex_;
    CompletionHandler completion_handler_;
};

} // namespace sniprun
