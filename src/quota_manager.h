#pragma once

#include "constants.h"
#include "types.h"

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace sniprun {

enum class Admission {
    ALLOWED,
    THROTTLED,
    REJECTED
};

struct AdmissionDecision {
    Admission admission = Admission::ALLOWED;
    std::chrono::seconds retry_after{0};
    std::string reason;

    bool allowed() const { return admission == Admission::ALLOWED; }
};

// Point-in-time view of one session's quota
struct SessionQuota {
    std::string client_session_id;
    double tokens_remaining = 0;
    int concurrent_count = 0;
    std::chrono::steady_clock::time_point window_reset_at;   // Bucket full again
    bool flagged = false;
};

// Refills continuously at `refill_per_second` up to `capacity`
class TokenBucket {
public:
    using time_point = std::chrono::steady_clock::time_point;

    TokenBucket(double capacity, double refill_per_second, time_point now);

    bool try_consume(time_point now);
    void refund(time_point now);
    double available(time_point now);

    // Time until one token is available
    std::chrono::milliseconds time_until_token(time_point now);
    time_point full_at(time_point now);

private:
    void refill(time_point now);

    double capacity_;
    double refill_per_second_;
    double tokens_;
    time_point last_refill_;
};

// Per-session admission control: a token bucket for submission rate, a cap
// on requests admitted but not finished, and a temporary ban for sessions
// that keep running into the resource limits.
class QuotaManager {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Config {
        double bucket_capacity;
        double refill_per_second;
        int max_concurrent;
        int abuse_threshold;
        std::chrono::seconds abuse_window;
        std::chrono::seconds ban_duration;
        std::chrono::minutes idle_cleanup;

        Config() :
            bucket_capacity(DEFAULT_BUCKET_CAPACITY),
            refill_per_second(DEFAULT_REFILL_PER_SECOND),
            max_concurrent(MAX_CONCURRENT_PER_SESSION),
            abuse_threshold(ABUSE_THRESHOLD),
            abuse_window(ABUSE_WINDOW_SECONDS),
            ban_duration(BAN_DURATION_SECONDS),
            idle_cleanup(SESSION_CLEANUP_MINUTES) {}
    };

    explicit QuotaManager(const Config& config = Config(), Clock clock = nullptr);

    // Takes a token and a concurrency slot when allowed
    AdmissionDecision admit(const std::string& session_id);

    // The admitted request finished with `outcome`
    void release(const std::string& session_id, Outcome outcome);

    // The admitted request never got queued; give the token back too
    void cancel_admission(const std::string& session_id);

    SessionQuota snapshot(const std::string& session_id);

    // Forget sessions idle for longer than idle_cleanup with nothing in flight
    size_t cleanup_idle();
    size_t session_count() const;

private:
    struct Entry {
        explicit Entry(const Config& config, std::chrono::steady_clock::time_point now)
            : bucket(config.bucket_capacity, config.refill_per_second, now), last_seen(now) {}

        std::mutex mutex;
        TokenBucket bucket;
        int concurrent = 0;
        std::deque<std::chrono::steady_clock::time_point> limit_hits;
        std::chrono::steady_clock::time_point banned_until{};
        std::chrono::steady_clock::time_point last_seen;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    static constexpr size_t SHARD_COUNT = 16;
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, EntryPtr> entries;
    };

    Shard& shard_for(const std::string& session_id);
    EntryPtr find(const std::string& session_id);
    EntryPtr find_or_create(const std::string& session_id);
    bool banned(const Entry& entry, std::chrono::steady_clock::time_point now) const;

    Config config_;
    Clock clock_;
    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace sniprun
