#include "quota_manager.h"
#include "log.h"

#include <algorithm>
#include <cmath>

namespace sniprun {

// TokenBucket

TokenBucket::TokenBucket(double capacity, double refill_per_second, time_point now)
    : capacity_(capacity), refill_per_second_(refill_per_second),
      tokens_(capacity), last_refill_(now) {}

void TokenBucket::refill(time_point now) {
    if (now <= last_refill_) return;

    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_per_second_);
    last_refill_ = now;
}

bool TokenBucket::try_consume(time_point now) {
    refill(now);
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

void TokenBucket::refund(time_point now) {
    refill(now);
    tokens_ = std::min(capacity_, tokens_ + 1.0);
}

double TokenBucket::available(time_point now) {
    refill(now);
    return tokens_;
}

std::chrono::milliseconds TokenBucket::time_until_token(time_point now) {
    refill(now);
    if (tokens_ >= 1.0) {
        return std::chrono::milliseconds(0);
    }
    if (refill_per_second_ <= 0) {
        return std::chrono::milliseconds::max();
    }
    double seconds = (1.0 - tokens_) / refill_per_second_;
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000)));
}

TokenBucket::time_point TokenBucket::full_at(time_point now) {
    refill(now);
    if (tokens_ >= capacity_ || refill_per_second_ <= 0) {
        return now;
    }
    double seconds = (capacity_ - tokens_) / refill_per_second_;
    return now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

// QuotaManager

QuotaManager::QuotaManager(const Config& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

QuotaManager::Shard& QuotaManager::shard_for(const std::string& session_id) {
    return shards_[std::hash<std::string>{}(session_id) % SHARD_COUNT];
}

QuotaManager::EntryPtr QuotaManager::find(const std::string& session_id) {
    Shard& shard = shard_for(session_id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(session_id);
    return it == shard.entries.end() ? nullptr : it->second;
}

QuotaManager::EntryPtr QuotaManager::find_or_create(const std::string& session_id) {
    if (EntryPtr entry = find(session_id)) {
        return entry;
    }

    Shard& shard = shard_for(session_id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto& slot = shard.entries[session_id];
    if (!slot) {
        slot = std::make_shared<Entry>(config_, clock_());
    }
    return slot;
}

bool QuotaManager::banned(const Entry& entry, std::chrono::steady_clock::time_point now) const {
    return now < entry.banned_until;
}

AdmissionDecision QuotaManager::admit(const std::string& session_id) {
    EntryPtr entry = find_or_create(session_id);
    auto now = clock_();
    AdmissionDecision decision;

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->last_seen = now;

    if (banned(*entry, now)) {
        decision.admission = Admission::REJECTED;
        decision.retry_after = std::chrono::duration_cast<std::chrono::seconds>(
            entry->banned_until - now) + std::chrono::seconds(1);
        decision.reason = "session temporarily blocked after repeated limit violations";
        return decision;
    }

    if (entry->concurrent >= config_.max_concurrent) {
        decision.admission = Admission::THROTTLED;
        decision.retry_after = std::chrono::seconds(1);
        decision.reason = "too many executions in progress (max " +
                          std::to_string(config_.max_concurrent) + ")";
        return decision;
    }

    if (!entry->bucket.try_consume(now)) {
        auto wait = entry->bucket.time_until_token(now);
        long long seconds = (wait.count() + 999) / 1000;
        decision.admission = Admission::THROTTLED;
        decision.retry_after = std::chrono::seconds(std::max(1LL, seconds));
        decision.reason = "submission rate exceeded";
        return decision;
    }

    entry->concurrent++;
    return decision;
}

void QuotaManager::release(const std::string& session_id, Outcome outcome) {
    EntryPtr entry = find(session_id);
    if (!entry) return;

    auto now = clock_();
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->last_seen = now;
    if (entry->concurrent > 0) {
        entry->concurrent--;
    }

    if (outcome != Outcome::TIMED_OUT && outcome != Outcome::RESOURCE_EXCEEDED) {
        return;
    }

    entry->limit_hits.push_back(now);
    while (!entry->limit_hits.empty() && now - entry->limit_hits.front() > config_.abuse_window) {
        entry->limit_hits.pop_front();
    }

    if (static_cast<int>(entry->limit_hits.size()) >= config_.abuse_threshold) {
        entry->banned_until = now + config_.ban_duration;
        entry->limit_hits.clear();
        log::warn("Quota", "session " + session_id + " blocked for " +
                  std::to_string(config_.ban_duration.count()) + "s after repeated limit violations");
    }
}

void QuotaManager::cancel_admission(const std::string& session_id) {
    EntryPtr entry = find(session_id);
    if (!entry) return;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->concurrent > 0) {
        entry->concurrent--;
    }
    entry->bucket.refund(clock_());
}

SessionQuota QuotaManager::snapshot(const std::string& session_id) {
    EntryPtr entry = find_or_create(session_id);
    auto now = clock_();

    SessionQuota quota;
    quota.client_session_id = session_id;

    std::lock_guard<std::mutex> lock(entry->mutex);
    quota.tokens_remaining = entry->bucket.available(now);
    quota.concurrent_count = entry->concurrent;
    quota.window_reset_at = entry->bucket.full_at(now);
    quota.flagged = banned(*entry, now);
    return quota;
}

size_t QuotaManager::cleanup_idle() {
    auto now = clock_();
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            bool idle;
            {
                std::lock_guard<std::mutex> entry_lock(it->second->mutex);
                const Entry& entry = *it->second;
                idle = entry.concurrent == 0 && !banned(entry, now) &&
                       now - entry.last_seen > config_.idle_cleanup;
            }
            if (idle) {
                it = shard.entries.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t QuotaManager::session_count() const {
    size_t count = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        count += shard.entries.size();
    }
    return count;
}

} // namespace sniprun
