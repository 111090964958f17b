#include <gtest/gtest.h>
#include "quota_manager.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace sniprun {
namespace {

class QuotaManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.bucket_capacity = 3;
        config.refill_per_second = 1.0;
        config.max_concurrent = 2;
        config.abuse_threshold = 3;
        config.abuse_window = std::chrono::seconds(60);
        config.ban_duration = std::chrono::seconds(120);
        config.idle_cleanup = std::chrono::minutes(5);

        now = std::chrono::steady_clock::time_point(std::chrono::hours(1));
        quota = std::make_unique<QuotaManager>(config, [this] { return now; });
    }

    void advance(std::chrono::milliseconds delta) { now += delta; }

    QuotaManager::Config config;
    std::chrono::steady_clock::time_point now;
    std::unique_ptr<QuotaManager> quota;
};

TEST_F(QuotaManagerTest, FirstRequestIsAllowed) {
    auto decision = quota->admit("alice");

    EXPECT_EQ(decision.admission, Admission::ALLOWED);
    EXPECT_TRUE(decision.allowed());
    EXPECT_EQ(quota->snapshot("alice").concurrent_count, 1);
}

TEST_F(QuotaManagerTest, ConcurrentCapThrottlesWithRetryAfter) {
    // Given: a session with two executions in flight
    ASSERT_TRUE(quota->admit("alice").allowed());
    ASSERT_TRUE(quota->admit("alice").allowed());

    // When: it submits a third
    auto decision = quota->admit("alice");

    // Then: it is throttled and told when to retry
    EXPECT_EQ(decision.admission, Admission::THROTTLED);
    EXPECT_GE(decision.retry_after.count(), 1);

    // And: finishing one frees the slot
    quota->release("alice", Outcome::COMPLETED);
    EXPECT_TRUE(quota->admit("alice").allowed());
}

TEST_F(QuotaManagerTest, EmptyBucketThrottlesUntilRefill) {
    // Given: the whole burst used up
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(quota->admit("bob").allowed());
        quota->release("bob", Outcome::COMPLETED);
    }

    // When: one more arrives immediately
    auto decision = quota->admit("bob");

    // Then: throttled for about one refill interval
    EXPECT_EQ(decision.admission, Admission::THROTTLED);
    EXPECT_EQ(decision.retry_after.count(), 1);

    // And: after the refill interval it is allowed again
    advance(std::chrono::milliseconds(1000));
    EXPECT_TRUE(quota->admit("bob").allowed());
}

TEST_F(QuotaManagerTest, RetryAfterIsRoundedUp) {
    config.refill_per_second = 0.25;
    quota = std::make_unique<QuotaManager>(config, [this] { return now; });

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(quota->admit("slow").allowed());
        quota->release("slow", Outcome::COMPLETED);
    }

    advance(std::chrono::milliseconds(500));
    auto decision = quota->admit("slow");
    EXPECT_EQ(decision.admission, Admission::THROTTLED);
    EXPECT_EQ(decision.retry_after.count(), 4);   // 3.5 s left
}

TEST_F(QuotaManagerTest, SessionsAreIndependent) {
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(quota->admit("alice").allowed());
    }
    EXPECT_FALSE(quota->admit("alice").allowed());

    EXPECT_TRUE(quota->admit("carol").allowed());
}

TEST_F(QuotaManagerTest, RepeatedLimitHitsGetSessionRejected) {
    // Given: three executions in a row that hit resource limits
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(quota->admit("mallory").allowed());
        quota->release("mallory", i % 2 ? Outcome::TIMED_OUT : Outcome::RESOURCE_EXCEEDED);
        advance(std::chrono::seconds(5));
    }

    // Then: the session is rejected, not merely throttled
    auto decision = quota->admit("mallory");
    EXPECT_EQ(decision.admission, Admission::REJECTED);
    EXPECT_GT(decision.retry_after.count(), 100);
    EXPECT_TRUE(quota->snapshot("mallory").flagged);

    // And: the ban ends after ban_duration
    advance(std::chrono::seconds(121));
    EXPECT_TRUE(quota->admit("mallory").allowed());
}

TEST_F(QuotaManagerTest, LimitHitsOutsideWindowAreForgotten) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(quota->admit("eve").allowed());
        quota->release("eve", Outcome::TIMED_OUT);
        advance(std::chrono::seconds(40));
    }

    // Hits were 40 s apart, never three inside one 60 s window
    EXPECT_TRUE(quota->admit("eve").allowed());
}

TEST_F(QuotaManagerTest, RuntimeErrorsDoNotCountAsAbuse) {
    for (int i = 0; i < 10; ++i) {
        advance(std::chrono::seconds(2));
        ASSERT_TRUE(quota->admit("learner").allowed());
        quota->release("learner", Outcome::RUNTIME_ERROR);
    }
    EXPECT_FALSE(quota->snapshot("learner").flagged);
}

TEST_F(QuotaManagerTest, CancelledAdmissionRefundsToken) {
    ASSERT_TRUE(quota->admit("dave").allowed());
    double before = quota->snapshot("dave").tokens_remaining;

    quota->cancel_admission("dave");

    auto snap = quota->snapshot("dave");
    EXPECT_DOUBLE_EQ(snap.tokens_remaining, before + 1.0);
    EXPECT_EQ(snap.concurrent_count, 0);
}

TEST_F(QuotaManagerTest, SnapshotReportsWindowReset) {
    ASSERT_TRUE(quota->admit("frank").allowed());
    auto snap = quota->snapshot("frank");

    EXPECT_EQ(snap.client_session_id, "frank");
    EXPECT_DOUBLE_EQ(snap.tokens_remaining, 2.0);
    EXPECT_EQ(snap.window_reset_at, now + std::chrono::seconds(1));
}

TEST_F(QuotaManagerTest, CleanupDropsOnlyIdleSessions) {
    ASSERT_TRUE(quota->admit("idle").allowed());
    quota->release("idle", Outcome::COMPLETED);
    ASSERT_TRUE(quota->admit("busy").allowed());

    advance(std::chrono::minutes(6));

    EXPECT_EQ(quota->cleanup_idle(), 1u);
    EXPECT_EQ(quota->session_count(), 1u);
}

TEST_F(QuotaManagerTest, ConcurrentAdmissionsNeverExceedCap) {
    config.bucket_capacity = 1000;
    config.max_concurrent = 5;
    quota = std::make_unique<QuotaManager>(config);

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (quota->admit("shared").allowed()) allowed++;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(allowed.load(), 5);
}

} // namespace
} // namespace sniprun
