#include <gtest/gtest.h>
#include "worker_pool.h"
#include "errors.h"

#include <json/json.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>

namespace sniprun {
namespace {

bool eventually(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

RuntimeRegistry registry_from(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    Json::parseFromStream(builder, in, &root, &errors);
    return RuntimeRegistry::from_json(root);
}

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_root = std::filesystem::temp_directory_path() /
                    ("sniprun_pool_test_" + std::to_string(getpid()));
        config.max_workers = 2;
        config.isolation.work_root = work_root.string();
        config.isolation.cgroup_root.clear();
        config.isolation.use_namespaces = false;
    }

    void TearDown() override {
        std::filesystem::remove_all(work_root);
    }

    RequestPtr make_request(const std::string& id, const std::string& source,
                            Language language = Language::SHELL) {
        auto request = std::make_shared<ExecutionRequest>();
        request->id = id;
        request->language = language;
        request->source_code = source;
        request->client_session_id = "test";
        request->submitted_at = std::chrono::steady_clock::now();
        return request;
    }

    std::filesystem::path work_root;
    WorkerPool::Config config;
    RuntimeRegistry shell_only = registry_from(
        R"({"runtimes": [{"language": "shell", "warm_pool": 1, "wall_clock_ms": 10000}]})");
};

TEST_F(WorkerPoolTest, StartWarmsTargetWorkers) {
    WorkerPool pool(shell_only, config);
    pool.start();

    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 1; }));

    PoolStats stats = pool.stats();
    EXPECT_EQ(stats.live, 1u);
    EXPECT_EQ(stats.max_workers, 2u);
    EXPECT_FALSE(stats.namespaces);
    EXPECT_FALSE(stats.cgroups);
}

TEST_F(WorkerPoolTest, AcquireReturnsReadyWorkerOnce) {
    WorkerPool pool(shell_only, config);
    pool.start();
    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 1; }));

    auto worker = pool.acquire(Language::SHELL);

    ASSERT_NE(worker, nullptr);
    EXPECT_EQ(worker->state(), WorkerState::READY);
    EXPECT_EQ(pool.acquire(Language::SHELL), nullptr);
    EXPECT_EQ(pool.acquire(Language::PYTHON), nullptr);

    // Hand it back through an execution so the slot is released
    std::atomic<bool> done{false};
    pool.dispatch(worker, make_request("r0", "true\n"), nullptr,
                  [&](const RequestPtr&, const ExecutionResult&) { done = true; });
    EXPECT_TRUE(eventually([&] { return done.load(); }));
}

TEST_F(WorkerPoolTest, DispatchRunsAndReplenishes) {
    WorkerPool pool(shell_only, config);
    pool.start();
    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 1; }));

    std::mutex mutex;
    ExecutionResult captured;
    std::atomic<bool> done{false};
    std::string streamed;

    pool.dispatch(pool.acquire(Language::SHELL), make_request("r1", "echo pooled\n"),
                  [&](EventType, const std::string& chunk) {
                      std::lock_guard<std::mutex> lock(mutex);
                      streamed += chunk;
                  },
                  [&](const RequestPtr& request, const ExecutionResult& result) {
                      std::lock_guard<std::mutex> lock(mutex);
                      EXPECT_EQ(request->id, "r1");
                      captured = result;
                      done = true;
                  });

    ASSERT_TRUE(eventually([&] { return done.load(); }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(captured.outcome, Outcome::COMPLETED);
        EXPECT_EQ(captured.stdout_output, "pooled\n");
        EXPECT_EQ(streamed, "pooled\n");
    }

    // The used worker is gone and a fresh one takes its place
    EXPECT_TRUE(eventually([&] {
        PoolStats stats = pool.stats();
        return stats.ready == 1 && stats.executing == 0 && stats.executed_total == 1;
    }));
}

TEST_F(WorkerPoolTest, NeverExceedsMaxWorkers) {
    WorkerPool pool(shell_only, config);
    pool.start();

    pool.ensure_capacity(Language::SHELL, 10);

    for (int i = 0; i < 20; ++i) {
        EXPECT_LE(pool.stats().live, 2u);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(eventually([&] { return pool.stats().ready == 2; }));
}

TEST_F(WorkerPoolTest, EvictsIdleWorkersOfOtherLanguages) {
    RuntimeRegistry registry = registry_from(R"({"runtimes": [
        {"language": "shell", "warm_pool": 1},
        {"language": "lua", "command": ["/bin/sh", "{file}"], "file": "main.lua", "warm_pool": 1}
    ]})");
    WorkerPool pool(registry, config);
    pool.start();
    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 2; }));

    EXPECT_TRUE(pool.ensure_capacity(Language::SHELL, 2));

    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 2; }));
    auto first = pool.acquire(Language::SHELL);
    auto second = pool.acquire(Language::SHELL);
    EXPECT_NE(first, nullptr);
    EXPECT_NE(second, nullptr);
    EXPECT_EQ(pool.acquire(Language::LUA), nullptr);

    std::atomic<int> done{0};
    auto completion = [&](const RequestPtr&, const ExecutionResult&) { done++; };
    pool.dispatch(first, make_request("e1", "true\n"), nullptr, completion);
    pool.dispatch(second, make_request("e2", "true\n"), nullptr, completion);
    EXPECT_TRUE(eventually([&] { return done.load() == 2; }));
}

TEST_F(WorkerPoolTest, LanguageDisabledAfterRepeatedWarmupFailures) {
    RuntimeRegistry registry = registry_from(R"({"runtimes": [
        {"language": "lua", "command": ["sniprun-no-such-lua", "{file}"], "warm_pool": 1}
    ]})");
    WorkerPool pool(registry, config);
    pool.start();

    bool disabled = eventually([&] {
        if (!pool.language_available(Language::LUA)) return true;
        if (pool.stats().warming == 0) pool.ensure_capacity(Language::LUA, 1);
        return false;
    });

    EXPECT_TRUE(disabled);
    EXPECT_FALSE(pool.ensure_capacity(Language::LUA, 1));
    EXPECT_EQ(pool.stats().live, 0u);
}

TEST_F(WorkerPoolTest, CancelStopsRunningRequest) {
    WorkerPool pool(shell_only, config);
    pool.start();
    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 1; }));

    std::atomic<bool> done{false};
    std::atomic<int> outcome{-1};
    pool.dispatch(pool.acquire(Language::SHELL), make_request("spin", "while true; do :; done\n"),
                  nullptr, [&](const RequestPtr&, const ExecutionResult& result) {
                      outcome = static_cast<int>(result.outcome);
                      done = true;
                  });

    ASSERT_TRUE(eventually([&] { return pool.stats().executing == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(pool.cancel("spin"));
    EXPECT_FALSE(pool.cancel("unknown"));

    ASSERT_TRUE(eventually([&] { return done.load(); }));
    EXPECT_EQ(outcome.load(), static_cast<int>(Outcome::CANCELLED));
}

TEST_F(WorkerPoolTest, StopCancelsRunningExecutions) {
    WorkerPool pool(shell_only, config);
    pool.start();
    ASSERT_TRUE(eventually([&] { return pool.stats().ready == 1; }));

    std::atomic<bool> done{false};
    pool.dispatch(pool.acquire(Language::SHELL), make_request("long", "while true; do :; done\n"),
                  nullptr, [&](const RequestPtr&, const ExecutionResult&) { done = true; });
    ASSERT_TRUE(eventually([&] { return pool.stats().executing == 1; }));

    auto start = std::chrono::steady_clock::now();
    pool.stop();

    EXPECT_TRUE(done.load());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(pool.stats().live, 0u);
}

TEST_F(WorkerPoolTest, RequiredNamespacesRefuseToStartWithoutThem) {
    config.isolation.use_namespaces = true;
    config.require_namespaces = true;
    WorkerPool pool(shell_only, config);

    if (IsolationWorker::probe_namespaces(config.isolation)) {
        GTEST_SKIP() << "host supports namespaces";
    }
    EXPECT_THROW(pool.start(), SandboxError);
}

} // namespace
} // namespace sniprun
