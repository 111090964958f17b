#include "scheduler.h"
#include "errors.h"
#include "log.h"

#include <map>
#include <set>
#include <utility>
#include <vector>

namespace sniprun {

Scheduler::Scheduler(WorkerPool& pool, ResultAggregator& aggregator, const Config& config)
    : pool_(pool), aggregator_(aggregator), config_(config) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if (running_.exchange(true)) return;

    pool_.set_on_ready([this] {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            wake_ = true;
        }
        cv_.notify_one();
    });

    dispatcher_ = std::thread([this] { dispatch_loop(); });
    log::info("Scheduler", "Queue depth " + std::to_string(config_.max_queue_depth) +
              ", max wait " + std::to_string(config_.max_queue_wait.count()) + " ms");
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }

    if (running_.exchange(false)) {
        cv_.notify_all();
        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }
        pool_.set_on_ready(nullptr);
    }

    std::deque<RequestPtr> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned.swap(pending_);
    }
    for (const auto& request : abandoned) {
        finish(*request, unexecuted(*request, Outcome::CANCELLED, "service shutting down"), false);
    }
}

size_t Scheduler::enqueue(RequestPtr request) {
    size_t position;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            throw RejectedError(ErrorCode::SERVICE_BUSY, "service shutting down",
                                std::chrono::seconds(1));
        }
        if (pending_.size() >= config_.max_queue_depth) {
            throw RejectedError(ErrorCode::SERVICE_BUSY, "execution queue is full",
                                std::chrono::seconds(1));
        }
        pending_.push_back(std::move(request));
        position = pending_.size();
        wake_ = true;
    }
    cv_.notify_one();
    return position;
}

bool Scheduler::cancel(const std::string& request_id) {
    RequestPtr removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end(); ++it) {
            if ((*it)->id == request_id) {
                removed = *it;
                pending_.erase(it);
                break;
            }
        }
        if (!removed) {
            // Dispatch happens under mutex_, so a request is either here or in the pool
            return pool_.cancel(request_id);
        }
    }

    finish(*removed, unexecuted(*removed, Outcome::CANCELLED, "execution cancelled"), false);
    return true;
}

std::optional<size_t> Scheduler::queue_position(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i]->id == request_id) {
            return i + 1;
        }
    }
    return std::nullopt;
}

size_t Scheduler::queue_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void Scheduler::set_completion_handler(CompletionHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    completion_handler_ = std::move(handler);
}

ExecutionResult Scheduler::unexecuted(const ExecutionRequest& request, Outcome outcome,
                                      const std::string& message) const {
    ExecutionResult result;
    result.request_id = request.id;
    result.outcome = outcome;
    result.exit_code = -1;
    result.message = message;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request.submitted_at);
    return result;
}

void Scheduler::finish(const ExecutionRequest& request, const ExecutionResult& result, bool executed) {
    log::info("Scheduler", request.id + " " + outcome_to_string(result.outcome) + " (" +
              language_to_string(request.language) + ", " + std::to_string(result.duration.count()) + " ms)");

    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = completion_handler_;
    }
    if (handler) {
        handler(request, result, executed);
    }

    // Quota is settled before a waiting client can see the result
    aggregator_.complete(request.id, result);
}

void Scheduler::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<RequestPtr, std::string>> failed;
        std::map<Language, size_t> demand;
        std::set<std::string> blocked_sessions;

        for (auto it = pending_.begin(); it != pending_.end();) {
            RequestPtr request = *it;

            if (now - request->submitted_at >= config_.max_queue_wait) {
                failed.emplace_back(request, "queue wait exceeded");
                it = pending_.erase(it);
                continue;
            }

            // Only the oldest pending request of a session is eligible
            if (!blocked_sessions.insert(request->client_session_id).second) {
                ++it;
                continue;
            }

            if (!pool_.language_available(request->language)) {
                failed.emplace_back(request, "");
                it = pending_.erase(it);
                continue;
            }

            WorkerPool::WorkerPtr worker = pool_.acquire(request->language);
            if (!worker) {
                demand[request->language]++;
                ++it;
                continue;
            }

            it = pending_.erase(it);
            const std::string id = request->id;
            aggregator_.set_state(id, RequestState::RUNNING);
            aggregator_.publish(id, EventType::STATUS, "running");
            pool_.dispatch(worker, request,
                [this, id](EventType type, const std::string& chunk) {
                    aggregator_.publish(id, type, chunk);
                },
                [this](const RequestPtr& done, const ExecutionResult& result) {
                    finish(*done, result, true);
                });
        }

        lock.unlock();

        for (const auto& [request, reason] : failed) {
            if (reason.empty()) {
                log::alert("Scheduler", "no usable runtime for " + language_to_string(request->language) +
                           ", failing " + request->id);
                finish(*request, unexecuted(*request, Outcome::INTERNAL_ERROR, "internal error"), false);
            } else {
                finish(*request, unexecuted(*request, Outcome::TIMED_OUT, reason), false);
            }
        }
        for (const auto& [language, waiting] : demand) {
            pool_.ensure_capacity(language, waiting);
        }

        lock.lock();
        cv_.wait_for(lock, std::chrono::milliseconds(100), [this] { return wake_ || !running_; });
        wake_ = false;
    }
}

} // namespace sniprun
