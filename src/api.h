#pragma once

#include "errors.h"
#include "gateway.h"
#include "http_server.h"
#include "quota_manager.h"
#include "result_aggregator.h"
#include "runtime_registry.h"
#include "scheduler.h"
#include "worker_pool.h"

#include <string>

namespace Json {
class Value;
}

namespace sniprun {

// The pieces the HTTP layer talks to
struct ApiContext {
    Gateway& gateway;
    Scheduler& scheduler;
    WorkerPool& pool;
    QuotaManager& quota;
    const RuntimeRegistry& registry;
};

// Install every public endpoint on the server
void register_routes(HttpServer& server, ApiContext context);

// X-Session-Id when present and sane, the client address otherwise
std::string session_id_for(const HttpRequest& req);

int http_status_for(ErrorCode code);
HttpResponse error_response(const RejectedError& error);

Json::Value event_to_json(const OutputEvent& event, const PollResult& poll);
Json::Value result_to_json(const ExecutionResult& result);

} // namespace sniprun
