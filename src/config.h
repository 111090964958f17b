#pragma once

#include "constants.h"
#include "gateway.h"
#include "quota_manager.h"
#include "result_aggregator.h"
#include "scheduler.h"
#include "worker_pool.h"

#include <string>

namespace Json {
class Value;
}

namespace sniprun {

// Everything the server reads at startup. Compiled defaults come from
// constants.h, then the JSON file (--config), then command-line flags.
struct ServiceConfig {
    int port = DEFAULT_PORT;
    size_t max_connections = MAX_CONNECTIONS;
    std::string runtimes_path;     // Empty: built-in runtimes
    bool quiet = false;
    int sweep_interval_seconds = 10;

    WorkerPool::Config pool;
    Scheduler::Config scheduler;
    QuotaManager::Config quota;
    Gateway::Config gateway;
    ResultAggregator::Config aggregator;

    ServiceConfig();

    // Throw ConfigError on unreadable files or wrongly typed fields
    static ServiceConfig from_file(const std::string& path);
    void merge_json(const Json::Value& root);

    // Parse argv. --config is applied first, the other flags override it.
    static ServiceConfig from_args(int argc, char* argv[]);

    static std::string usage(const std::string& program);
};

} // namespace sniprun
