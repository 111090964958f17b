#pragma once

#include "constants.h"
#include "isolation_worker.h"
#include "runtime_registry.h"
#include "seccomp_filter.h"
#include "thread_pool.h"
#include "types.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sniprun {

struct PoolStats {
    size_t max_workers = 0;
    size_t live = 0;        // Warming + Ready + Executing
    size_t warming = 0;
    size_t ready = 0;
    size_t executing = 0;
    uint64_t executed_total = 0;
    bool namespaces = false;
    bool cgroups = false;
};

// Owns every IsolationWorker. Keeps a few Ready workers per language so a
// request rarely waits for a warm-up, never lets the total exceed
// max_workers, and runs executions on its own threads.
class WorkerPool {
public:
    struct Config {
        size_t max_workers;
        IsolationConfig isolation;
        bool require_namespaces;   // Refuse to start without namespaces

        Config() :
            max_workers(DEFAULT_MAX_WORKERS),
            require_namespaces(false) {}
    };

    using Completion = std::function<void(const RequestPtr& request, const ExecutionResult& result)>;
    using WorkerPtr = std::shared_ptr<IsolationWorker>;

    WorkerPool(const RuntimeRegistry& registry, const Config& config = Config());
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Probe the host, compile the syscall filters and warm the pools.
    // Throws SandboxError when namespaces are required but unavailable.
    void start();
    void stop();

    // Take a Ready worker for the language, or nullptr
    WorkerPtr acquire(Language language);

    // Make sure at least `demand` workers are Ready or Warming for the
    // language, evicting idle workers of other languages when the pool is
    // full. False when nothing more can be started right now.
    bool ensure_capacity(Language language, size_t demand);

    // Run the request on an acquired worker. `completion` is always called
    // exactly once, from an executor thread.
    void dispatch(WorkerPtr worker, RequestPtr request, OutputSink sink, Completion completion);

    // Signal the worker running this request. False if none is.
    bool cancel(const std::string& request_id);

    // False once warm-ups for the language keep failing
    bool language_available(Language language) const;

    // Called without locks held whenever a worker becomes Ready or a slot frees
    void set_on_ready(std::function<void()> callback);

    PoolStats stats() const;

private:
    struct LanguagePool {
        std::deque<WorkerPtr> ready;
        size_t warming = 0;
        size_t target = 0;
        int failed_warmups = 0;
        std::shared_ptr<const SeccompFilter> filter;
    };

    bool reserve_slot();
    void release_slot();
    bool start_warmup(Language language);
    void warm(Language language, WorkerPtr worker);
    void replenish();
    WorkerPtr evict_idle(Language except);
    void notify_ready();
    std::string next_worker_id(Language language);

    const RuntimeRegistry& registry_;
    Config config_;

    mutable std::mutex mutex_;                 // Guards pools_ and running_
    std::map<Language, LanguagePool> pools_;
    std::map<std::string, WorkerPtr> running_;

    std::atomic<size_t> live_{0};
    std::atomic<size_t> executing_{0};
    std::atomic<uint64_t> executed_total_{0};
    std::atomic<uint64_t> worker_counter_{0};
    std::atomic<bool> running_flag_{false};
    bool cgroups_ = false;

    std::mutex callback_mutex_;
    std::function<void()> on_ready_;

    std::unique_ptr<ThreadPool> executor_;
};

} // namespace sniprun
