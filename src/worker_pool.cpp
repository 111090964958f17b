#include "worker_pool.h"
#include "errors.h"
#include "log.h"
#include "resource_limiter.h"

#include <exception>
#include <vector>

namespace sniprun {

WorkerPool::WorkerPool(const RuntimeRegistry& registry, const Config& config)
    : registry_(registry), config_(config) {
    if (config_.max_workers == 0) {
        config_.max_workers = 1;
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_flag_) return;

    IsolationConfig& isolation = config_.isolation;
    if (isolation.use_namespaces && !IsolationWorker::probe_namespaces(isolation)) {
        if (config_.require_namespaces) {
            throw SandboxError("namespaces are required but cannot be created on this host");
        }
        log::warn("WorkerPool", "cannot create namespaces here; snippets run with rlimits "
                  "and a private directory only");
        isolation.use_namespaces = false;
    }

    if (!isolation.cgroup_root.empty() && !ResourceLimiter::probe_cgroups(isolation.cgroup_root)) {
        isolation.cgroup_root.clear();
    }
    cgroups_ = !isolation.cgroup_root.empty();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (Language language : registry_.languages()) {
            const RuntimeProfile* profile = registry_.find(language);
            LanguagePool& pool = pools_[language];
            pool.target = profile->warm_pool;
            // Without a network namespace the filter has to keep sockets closed
            pool.filter = std::make_shared<SeccompFilter>(
                SeccompFilter::compile(profile->denied_syscalls,
                                       !profile->allow_network && !isolation.use_namespaces));
        }
    }

    executor_ = std::make_unique<ThreadPool>(config_.max_workers);
    running_flag_ = true;

    log::info("WorkerPool", "Started with " + std::to_string(config_.max_workers) + " workers (" +
              (isolation.use_namespaces ? "namespaces" : "no namespaces") + ", " +
              (cgroups_ ? "cgroup v2" : "rlimits") + ")");

    replenish();
}

void WorkerPool::stop() {
    if (!running_flag_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, worker] : running_) {
            worker->cancel();
        }
    }

    // Running executions finish (cancelled) and report before this returns
    executor_->stop();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [language, pool] : pools_) {
        for (auto& worker : pool.ready) {
            worker->destroy();
            release_slot();
        }
        pool.ready.clear();
    }
    log::info("WorkerPool", "Stopped");
}

bool WorkerPool::reserve_slot() {
    size_t current = live_.load();
    while (current < config_.max_workers) {
        if (live_.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void WorkerPool::release_slot() {
    live_.fetch_sub(1);
}

std::string WorkerPool::next_worker_id(Language language) {
    return language_to_string(language) + "-" + std::to_string(++worker_counter_);
}

// Requires mutex_
bool WorkerPool::start_warmup(Language language) {
    if (!running_flag_ || !reserve_slot()) {
        return false;
    }

    LanguagePool& pool = pools_[language];
    auto worker = std::make_shared<IsolationWorker>(next_worker_id(language),
                                                    *registry_.find(language),
                                                    config_.isolation, pool.filter);
    pool.warming++;

    if (!executor_->submit([this, language, worker] { warm(language, worker); })) {
        pool.warming--;
        release_slot();
        return false;
    }
    return true;
}

void WorkerPool::warm(Language language, WorkerPtr worker) {
    bool ok = worker->warm_up();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        LanguagePool& pool = pools_[language];
        pool.warming--;

        if (ok && running_flag_) {
            pool.ready.push_back(worker);
            pool.failed_warmups = 0;
        } else {
            if (!ok && ++pool.failed_warmups == MAX_WARMUP_FAILURES) {
                log::alert("WorkerPool", language_to_string(language) + " disabled after " +
                           std::to_string(MAX_WARMUP_FAILURES) + " failed warm-ups");
            }
            worker->destroy();
            release_slot();
        }
    }

    notify_ready();
}

WorkerPool::WorkerPtr WorkerPool::acquire(Language language) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(language);
    if (it == pools_.end() || it->second.ready.empty()) {
        return nullptr;
    }

    WorkerPtr worker = it->second.ready.front();
    it->second.ready.pop_front();
    return worker;
}

// Requires mutex_. Takes the longest idle Ready worker of another language.
WorkerPool::WorkerPtr WorkerPool::evict_idle(Language except) {
    WorkerPtr victim;
    for (auto& [language, pool] : pools_) {
        if (language == except || pool.ready.empty()) continue;
        // Prefer languages holding more than their warm target
        if (!victim || pool.ready.size() > pool.target) {
            victim = pool.ready.front();
            if (pool.ready.size() > pool.target) break;
        }
    }
    if (!victim) return nullptr;

    auto& ready = pools_[victim->language()].ready;
    ready.pop_front();
    return victim;
}

bool WorkerPool::ensure_capacity(Language language, size_t demand) {
    std::vector<WorkerPtr> evicted;
    bool started = false;
    bool satisfied = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(language);
        if (it == pools_.end() || it->second.failed_warmups >= MAX_WARMUP_FAILURES) {
            return false;
        }

        size_t have = it->second.ready.size() + it->second.warming;
        while (have < demand) {
            if (start_warmup(language)) {
                started = true;
                have++;
                continue;
            }

            WorkerPtr victim = evict_idle(language);
            if (!victim) break;
            victim->destroy();
            release_slot();
            evicted.push_back(victim);
        }
        satisfied = have >= demand;
    }

    for (const auto& victim : evicted) {
        log::info("WorkerPool", "Evicted idle " + victim->id() + " for " + language_to_string(language));
    }
    return started || satisfied;
}

void WorkerPool::dispatch(WorkerPtr worker, RequestPtr request, OutputSink sink, Completion completion) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_[request->id] = worker;
    }
    executing_++;

    auto finish = [this, request, completion](const ExecutionResult& result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.erase(request->id);
        }
        executing_--;
        executed_total_++;
        release_slot();

        try {
            completion(request, result);
        } catch (const std::exception& e) {
            log::alert("WorkerPool", "completion for " + request->id + " threw: " + e.what());
        }
    };

    auto task = [this, worker, request, sink, finish] {
        ExecutionResult result;
        try {
            result = worker->execute(*request, sink);
        } catch (const std::exception& e) {
            log::alert("WorkerPool", worker->id() + " could not run " + request->id + ": " + e.what());
            worker->destroy();
            result.request_id = request->id;
            result.outcome = Outcome::INTERNAL_ERROR;
            result.exit_code = -1;
            result.message = "internal error";
        }

        finish(result);
        replenish();
        notify_ready();
    };

    if (!running_flag_ || !executor_->submit(task)) {
        worker->destroy();
        ExecutionResult result;
        result.request_id = request->id;
        result.outcome = Outcome::INTERNAL_ERROR;
        result.exit_code = -1;
        result.message = "internal error";
        finish(result);
    }
}

bool WorkerPool::cancel(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(request_id);
    if (it == running_.end()) {
        return false;
    }
    it->second->cancel();
    return true;
}

bool WorkerPool::language_available(Language language) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(language);
    return it != pools_.end() && it->second.failed_warmups < MAX_WARMUP_FAILURES;
}

void WorkerPool::replenish() {
    if (!running_flag_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [language, pool] : pools_) {
        if (pool.failed_warmups >= MAX_WARMUP_FAILURES) continue;
        while (pool.ready.size() + pool.warming < pool.target) {
            if (!start_warmup(language)) break;
        }
    }
}

void WorkerPool::set_on_ready(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_ready_ = std::move(callback);
}

void WorkerPool::notify_ready() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_ready_;
    }
    if (callback) callback();
}

PoolStats WorkerPool::stats() const {
    PoolStats stats;
    stats.max_workers = config_.max_workers;
    stats.live = live_;
    stats.executing = executing_;
    stats.executed_total = executed_total_;
    stats.namespaces = config_.isolation.use_namespaces;
    stats.cgroups = cgroups_;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [language, pool] : pools_) {
        stats.ready += pool.ready.size();
        stats.warming += pool.warming;
    }
    return stats;
}

} // namespace sniprun
