/**
 * End-to-end tests of the execution service over HTTP
 *
 * Wires the whole stack the way main() does, on a free port, with the
 * shell runtime and without namespaces so it runs on any CI host.
 */

#include <gtest/gtest.h>
#include "api.h"
#include "log.h"
#include "http_test_client.h"

#include <json/json.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

namespace sniprun {
namespace {

using namespace testing_client;

Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        ADD_FAILURE() << "invalid JSON: " << errors << "\n" << text;
    }
    return root;
}

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

class ExecutionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::set_quiet(true);

        work_root = std::filesystem::temp_directory_path() /
                    ("sniprun_service_test_" + std::to_string(getpid()));

        Json::Value catalog = parse_json(
            R"({"runtimes": [{"language": "shell", "warm_pool": 1, "wall_clock_ms": 2000}]})");
        registry = RuntimeRegistry::from_json(catalog);

        WorkerPool::Config pool_config;
        pool_config.max_workers = 2;
        pool_config.isolation.work_root = work_root.string();
        pool_config.isolation.cgroup_root.clear();
        pool_config.isolation.use_namespaces = false;

        QuotaManager::Config quota_config;
        quota_config.bucket_capacity = 20;
        quota_config.refill_per_second = 0.1;
        quota_config.max_concurrent = 1;

        Gateway::Config gateway_config;
        gateway_config.max_source_bytes = 1024;

        pool = std::make_unique<WorkerPool>(registry, pool_config);
        aggregator = std::make_unique<ResultAggregator>();
        scheduler = std::make_unique<Scheduler>(*pool, *aggregator);
        quota = std::make_unique<QuotaManager>(quota_config);
        gateway = std::make_unique<Gateway>(registry, *quota, *scheduler, *aggregator, gateway_config);

        pool->start();
        scheduler->start();

        server = std::make_unique<HttpServer>(0);
        register_routes(*server, ApiContext{*gateway, *scheduler, *pool, *quota, registry});
        server->bind_and_listen();
        port = server->port();
        server_thread = std::thread([this] { server->start(); });
    }

    // Same order as main(): results for everything accepted, then connections
    void shut_down() {
        server->stop_accepting();
        scheduler->stop();
        pool->stop();
        server->stop();
    }

    void TearDown() override {
        shut_down();
        server_thread.join();
        std::filesystem::remove_all(work_root);
        log::set_quiet(false);
    }

    Json::Value post_json(const std::string& path, const Json::Value& body, int& status,
                          const std::string& session = "") {
        std::string headers = session.empty() ? "" : "X-Session-Id: " + session + "\r\n";
        std::string response = http(port, "POST", path, to_json(body), headers);
        status = status_of(response);
        return parse_json(body_of(response));
    }

    Json::Value get_json(const std::string& path, int& status) {
        std::string response = http(port, "GET", path);
        status = status_of(response);
        return parse_json(body_of(response));
    }

    std::string submit(const std::string& source, const std::string& session = "") {
        Json::Value body;
        body["language"] = "shell";
        body["source"] = source;
        int status = 0;
        Json::Value reply = post_json("/execute", body, status, session);
        EXPECT_EQ(status, 202) << to_json(reply);
        return reply["request_id"].asString();
    }

    // Poll with a moving cursor until the result arrives
    Json::Value poll_until_done(const std::string& request_id, std::string& stdout_text) {
        uint64_t cursor = 0;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
        while (std::chrono::steady_clock::now() < deadline) {
            int status = 0;
            Json::Value reply = get_json("/execute/" + request_id + "?cursor=" + std::to_string(cursor), status);
            if (status != 200) {
                ADD_FAILURE() << "poll returned " << status;
                return reply;
            }
            for (const auto& event : reply["events"]) {
                if (event["type"].asString() == "stdout") stdout_text += event["data"].asString();
                if (event["type"].asString() == "result") return event;
            }
            cursor = reply["next_cursor"].asUInt64();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        ADD_FAILURE() << "no result for " << request_id;
        return Json::Value();
    }

    std::filesystem::path work_root;
    RuntimeRegistry registry;
    std::unique_ptr<WorkerPool> pool;
    std::unique_ptr<ResultAggregator> aggregator;
    std::unique_ptr<Scheduler> scheduler;
    std::unique_ptr<QuotaManager> quota;
    std::unique_ptr<Gateway> gateway;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
    int port = 0;
};

TEST_F(ExecutionServiceTest, HealthAndRuntimes) {
    int status = 0;
    EXPECT_EQ(get_json("/health", status)["status"].asString(), "ok");
    EXPECT_EQ(status, 200);

    Json::Value runtimes = get_json("/runtimes", status);
    ASSERT_EQ(runtimes["runtimes"].size(), 1u);
    EXPECT_EQ(runtimes["runtimes"][0]["language"].asString(), "shell");
    EXPECT_TRUE(runtimes["runtimes"][0]["available"].asBool());
    EXPECT_FALSE(runtimes["runtimes"][0]["network"].asBool());
}

TEST_F(ExecutionServiceTest, SubmitAndPollToCompletion) {
    // Given: A snippet writing to both streams
    std::string id = submit("echo out\necho err >&2\n");
    ASSERT_EQ(id.size(), 32u);

    // When: Polling until the result shows up
    std::string stdout_text;
    Json::Value result = poll_until_done(id, stdout_text);

    // Then: Output arrived as events and the result closes the stream
    EXPECT_EQ(stdout_text, "out\n");
    EXPECT_EQ(result["outcome"].asString(), "Completed");
    EXPECT_EQ(result["exit_code"].asInt(), 0);
    EXPECT_FALSE(result.isMember("stdout"));
}

TEST_F(ExecutionServiceTest, AcknowledgeDropsResult) {
    std::string id = submit("true\n");
    std::string ignored;
    poll_until_done(id, ignored);

    int status = 0;
    Json::Value reply = get_json("/execute/" + id + "?ack=1", status);
    EXPECT_EQ(status, 200);
    EXPECT_TRUE(reply["done"].asBool());

    get_json("/execute/" + id, status);
    EXPECT_EQ(status, 404);
}

TEST_F(ExecutionServiceTest, RuntimeErrorIsAResultNotAnError) {
    std::string id = submit("echo boom >&2\nexit 4\n");
    std::string ignored;
    Json::Value result = poll_until_done(id, ignored);

    EXPECT_EQ(result["outcome"].asString(), "RuntimeError");
    EXPECT_EQ(result["exit_code"].asInt(), 4);
}

TEST_F(ExecutionServiceTest, InfiniteLoopTimesOut) {
    std::string id = submit("while true; do :; done\n");
    std::string ignored;
    Json::Value result = poll_until_done(id, ignored);

    EXPECT_EQ(result["outcome"].asString(), "TimedOut");
}

TEST_F(ExecutionServiceTest, CallerErrorsAreRejected) {
    int status = 0;

    Json::Value body;
    body["language"] = "cobol";
    body["source"] = "DISPLAY 'HI'.";
    EXPECT_EQ(post_json("/execute", body, status)["error"].asString(), "InvalidLanguage");
    EXPECT_EQ(status, 400);

    body["language"] = "shell";
    body["source"] = std::string(2048, '#');
    EXPECT_EQ(post_json("/execute", body, status)["error"].asString(), "PayloadTooLarge");
    EXPECT_EQ(status, 400);

    std::string response = http(port, "POST", "/execute", "not json");
    EXPECT_EQ(status_of(response), 400);
    EXPECT_NE(body_of(response).find("BadRequest"), std::string::npos);

    body = Json::Value();
    body["language"] = "shell";
    EXPECT_EQ(post_json("/execute", body, status)["error"].asString(), "BadRequest");
}

TEST_F(ExecutionServiceTest, SecondConcurrentRequestIsThrottled) {
    // Given: A session limited to one request in flight
    std::string first = submit("while true; do :; done\n", "tab-1");

    // When: The same session submits again
    Json::Value body;
    body["language"] = "shell";
    body["source"] = "true\n";
    std::string response = http(port, "POST", "/execute", to_json(body), "X-Session-Id: tab-1\r\n");

    // Then: 429 with a retry hint; another session is fine
    EXPECT_EQ(status_of(response), 429);
    EXPECT_NE(response.find("Retry-After: "), std::string::npos);
    EXPECT_FALSE(submit("true\n", "tab-2").empty());

    Json::Value cancel = parse_json(body_of(http(port, "DELETE", "/execute/" + first)));
    EXPECT_TRUE(cancel["cancelled"].asBool());
    std::string ignored;
    EXPECT_EQ(poll_until_done(first, ignored)["outcome"].asString(), "Cancelled");
}

TEST_F(ExecutionServiceTest, CancelUnknownIsNotFound) {
    EXPECT_EQ(status_of(http(port, "DELETE", "/execute/0123456789abcdef")), 404);
    EXPECT_EQ(status_of(http(port, "GET", "/execute/0123456789abcdef")), 404);
}

TEST_F(ExecutionServiceTest, CodapiExecReturnsOutput) {
    Json::Value body;
    body["sandbox"] = "shell";
    body["command"] = "run";
    body["files"][""] = "echo $((1 + 1))\n";

    int status = 0;
    Json::Value reply = post_json("/v1/exec", body, status);

    EXPECT_EQ(status, 200);
    EXPECT_TRUE(reply["ok"].asBool());
    EXPECT_EQ(reply["stdout"].asString(), "2\n");
    EXPECT_EQ(reply["stderr"].asString(), "");
    EXPECT_EQ(reply["id"].asString().size(), 32u);
}

TEST_F(ExecutionServiceTest, CodapiExecReportsFailure) {
    Json::Value body;
    body["sandbox"] = "shell";
    body["files"][""] = "echo nope >&2\nexit 1\n";

    int status = 0;
    Json::Value reply = post_json("/v1/exec", body, status);

    EXPECT_EQ(status, 200);
    EXPECT_FALSE(reply["ok"].asBool());
    EXPECT_EQ(reply["stderr"].asString(), "nope\n");
    EXPECT_EQ(reply["outcome"].asString(), "RuntimeError");

    body["command"] = "test";
    post_json("/v1/exec", body, status);
    EXPECT_EQ(status, 400);
}

TEST_F(ExecutionServiceTest, StreamDeliversEventsOverWebSocket) {
    // Given: A queued request
    std::string id = submit("echo streamed\n");

    // When: Subscribing to its stream
    std::string reply;
    int sock = open_websocket(port, "/execute/" + id + "/stream", reply);
    ASSERT_GE(sock, 0) << reply;

    // Then: Events arrive in order, ending with the result and a close
    std::string stdout_text;
    std::string last_type;
    uint64_t last_seq = 0;
    bool first = true;
    WsFrame frame;
    while (read_ws_frame(sock, frame) && frame.opcode == 0x1) {
        Json::Value event = parse_json(frame.payload);
        if (!first) EXPECT_EQ(event["seq"].asUInt64(), last_seq + 1);
        first = false;
        last_seq = event["seq"].asUInt64();
        last_type = event["type"].asString();
        if (last_type == "stdout") stdout_text += event["data"].asString();
    }
    close(sock);

    EXPECT_EQ(frame.opcode, 0x8);
    EXPECT_EQ(last_type, "result");
    EXPECT_EQ(stdout_text, "streamed\n");

    // Delivered over the stream, so the result is dropped
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    do {
        status = status_of(http(port, "GET", "/execute/" + id));
        if (status == 404) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    } while (std::chrono::steady_clock::now() < deadline);
    EXPECT_EQ(status, 404);
}

TEST_F(ExecutionServiceTest, ShutdownAnswersRequestsInFlight) {
    // Given: A synchronous run holding its connection open
    Json::Value body;
    body["sandbox"] = "shell";
    body["files"][""] = "while true; do :; done\n";

    int status = 0;
    Json::Value reply;
    std::thread client([&] { reply = post_json("/v1/exec", body, status); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pool->stats().executing == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(pool->stats().executing, 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // When: The service shuts down
    shut_down();
    client.join();

    // Then: The handler finished before stop() returned and the client got its result
    EXPECT_EQ(server->active_connections(), 0u);
    EXPECT_EQ(status, 200);
    EXPECT_FALSE(reply["ok"].asBool());
    EXPECT_EQ(reply["outcome"].asString(), "Cancelled");
}

TEST_F(ExecutionServiceTest, StreamForUnknownRequestIsNotFound) {
    std::string reply;
    int sock = open_websocket(port, "/execute/doesnotexist/stream", reply);

    EXPECT_LT(sock, 0);
    EXPECT_EQ(status_of(reply), 404);
}

TEST_F(ExecutionServiceTest, StatsReportQuotaAndPool) {
    submit("true\n", "tab-9");

    std::string response = http(port, "GET", "/stats", "", "X-Session-Id: tab-9\r\n");
    Json::Value stats = parse_json(body_of(response));

    EXPECT_EQ(status_of(response), 200);
    EXPECT_LT(stats["quota"]["tokens_remaining"].asDouble(), 20.0);
    EXPECT_EQ(stats["workers"]["max"].asUInt64(), 2u);
    EXPECT_FALSE(stats["isolation"]["namespaces"].asBool());
    EXPECT_TRUE(stats["queue"].isMember("depth"));
}

} // namespace
} // namespace sniprun
