#include "api.h"
#include "log.h"
#include "websocket.h"

#include <json/json.h>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <memory>
#include <sstream>

namespace sniprun {

namespace {

const std::string EXECUTE_PREFIX = "/execute/";
const std::string STREAM_SUFFIX = "/stream";
constexpr size_t MAX_SESSION_ID_LENGTH = 128;
constexpr int STREAM_WAIT_MS = 250;

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = to_json(body);
    return resp;
}

HttpResponse error_json(int status, const std::string& error, const std::string& message) {
    Json::Value body;
    body["error"] = error;
    body["message"] = message;
    return json_response(status, body);
}

// Throws RejectedError(BAD_REQUEST) unless the body is a JSON object
Json::Value parse_body(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors) || !root.isObject()) {
        throw RejectedError(ErrorCode::BAD_REQUEST, "request body must be a JSON object");
    }
    return root;
}

std::string required_string(const Json::Value& root, const char* field) {
    if (!root[field].isString()) {
        throw RejectedError(ErrorCode::BAD_REQUEST, std::string("'") + field + "' must be a string");
    }
    return root[field].asString();
}

std::optional<std::string> optional_string(const Json::Value& root, const char* field) {
    if (!root.isMember(field) || root[field].isNull()) return std::nullopt;
    if (!root[field].isString()) {
        throw RejectedError(ErrorCode::BAD_REQUEST, std::string("'") + field + "' must be a string");
    }
    return root[field].asString();
}

// "/execute/{id}" -> id; empty for anything else
std::string request_id_from(const std::string& path) {
    if (path.compare(0, EXECUTE_PREFIX.size(), EXECUTE_PREFIX) != 0) return "";
    std::string id = path.substr(EXECUTE_PREFIX.size());
    if (id.empty() || id.find('/') != std::string::npos) return "";
    return id;
}

uint64_t cursor_from(const HttpRequest& req) {
    auto it = req.query.find("cursor");
    if (it == req.query.end() || it->second.empty()) return 0;
    try {
        return std::stoull(it->second);
    } catch (const std::exception&) {
        throw RejectedError(ErrorCode::BAD_REQUEST, "cursor must be a non-negative integer");
    }
}

Json::Value poll_to_json(const std::string& request_id, const PollResult& poll,
                         std::optional<size_t> queue_position) {
    Json::Value body;
    body["request_id"] = request_id;
    body["state"] = request_state_to_string(poll.state);
    if (queue_position) {
        body["queue_position"] = static_cast<Json::UInt64>(*queue_position);
    } else {
        body["queue_position"] = Json::nullValue;
    }

    Json::Value events(Json::arrayValue);
    for (const auto& event : poll.events) {
        events.append(event_to_json(event, poll));
    }
    body["events"] = events;
    body["next_cursor"] = static_cast<Json::UInt64>(poll.next_cursor);
    body["done"] = poll.done;
    return body;
}

bool client_has_data(int fd) {
    struct pollfd pfd = {fd, POLLIN, 0};
    return ::poll(&pfd, 1, 0) > 0;
}

void stream_events(ApiContext ctx, int client_fd, const HttpRequest& req) {
    std::string path = req.path.substr(0, req.path.size() - STREAM_SUFFIX.size());
    std::string request_id = request_id_from(path);

    if (request_id.empty() || !ctx.gateway.poll(request_id, 0).found) {
        std::string resp = HttpServer::build_response(error_json(404, "NotFound", "unknown request id"));
        send(client_fd, resp.data(), resp.size(), MSG_NOSIGNAL);
        return;
    }

    std::string handshake = WebSocketManager::create_handshake_response(req.header("sec-websocket-key"));
    if (send(client_fd, handshake.data(), handshake.size(), MSG_NOSIGNAL) !=
        static_cast<ssize_t>(handshake.size())) {
        ctx.gateway.cancel(request_id);
        return;
    }

    uint64_t cursor = 0;
    bool delivered = false;
    bool connected = true;

    while (connected && !delivered) {
        PollResult poll = ctx.gateway.wait(request_id, cursor, std::chrono::milliseconds(STREAM_WAIT_MS));
        if (!poll.found) break;

        for (const auto& event : poll.events) {
            if (!WebSocketManager::send_text(client_fd, to_json(event_to_json(event, poll)))) {
                connected = false;
                break;
            }
        }
        if (!connected) break;
        cursor = poll.next_cursor;

        if (poll.done) {
            delivered = true;
            break;
        }

        // Anything from the browser: pings, a close, or a dropped connection
        while (connected && client_has_data(client_fd)) {
            bool is_close = false;
            WSOpcode opcode = WSOpcode::TEXT;
            std::string payload = WebSocketManager::read_frame(client_fd, is_close, &opcode);
            if (is_close) {
                connected = false;
            } else if (opcode == WSOpcode::PING) {
                WebSocketManager::send_pong(client_fd, payload);
            }
        }
    }

    if (delivered) {
        WebSocketManager::send_close(client_fd);
        ctx.gateway.acknowledge(request_id);
    } else if (ctx.gateway.cancel(request_id)) {
        log::info("WebSocket", "Client left before " + request_id + " finished; cancelled");
    }
}

} // namespace

std::string session_id_for(const HttpRequest& req) {
    std::string session = req.header("x-session-id");
    if (session.empty() || session.size() > MAX_SESSION_ID_LENGTH) {
        return req.client_ip;
    }
    for (unsigned char c : session) {
        if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') {
            return req.client_ip;
        }
    }
    return "session:" + session;
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_LANGUAGE:
        case ErrorCode::PAYLOAD_TOO_LARGE:
        case ErrorCode::BAD_REQUEST:
            return 400;
        case ErrorCode::THROTTLED: return 429;
        case ErrorCode::REJECTED: return 403;
        case ErrorCode::SERVICE_BUSY: return 503;
        case ErrorCode::NOT_FOUND: return 404;
    }
    return 500;
}

HttpResponse error_response(const RejectedError& error) {
    HttpResponse resp = error_json(http_status_for(error.code()), error_code_to_string(error.code()),
                                   error.what());
    if (error.retry_after().count() > 0) {
        resp.headers["Retry-After"] = std::to_string(error.retry_after().count());
    }
    return resp;
}

Json::Value result_to_json(const ExecutionResult& result) {
    Json::Value body;
    body["outcome"] = outcome_to_string(result.outcome);
    body["exit_code"] = result.exit_code;
    body["duration_ms"] = static_cast<Json::Int64>(result.duration.count());
    body["truncated"] = result.truncated;
    body["stdout"] = result.stdout_output;
    body["stderr"] = result.stderr_output;
    body["cpu_seconds"] = result.cpu_seconds;
    body["memory_peak_bytes"] = static_cast<Json::UInt64>(result.memory_peak_bytes);
    if (!result.message.empty()) {
        body["message"] = result.message;
    }
    return body;
}

Json::Value event_to_json(const OutputEvent& event, const PollResult& poll) {
    Json::Value json;
    if (event.type == EventType::RESULT && poll.result) {
        json = result_to_json(*poll.result);
        // Output already went out as stdout/stderr events
        json.removeMember("stdout");
        json.removeMember("stderr");
    }
    json["seq"] = static_cast<Json::UInt64>(event.seq);
    json["type"] = event_type_to_string(event.type);
    if (event.type != EventType::RESULT) {
        json["data"] = event.data;
    }
    return json;
}

void register_routes(HttpServer& server, ApiContext ctx) {
    // POST /execute - queue a snippet
    server.route("POST", "/execute", [ctx](const HttpRequest& req) {
        try {
            Json::Value body = parse_body(req.body);
            SubmitHandle handle = ctx.gateway.submit(required_string(body, "language"),
                                                     required_string(body, "source"),
                                                     optional_string(body, "stdin"),
                                                     session_id_for(req));
            Json::Value out;
            out["request_id"] = handle.request_id;
            out["queue_position"] = static_cast<Json::UInt64>(handle.queue_position);
            out["stream"] = EXECUTE_PREFIX + handle.request_id + STREAM_SUFFIX;
            return json_response(202, out);
        } catch (const RejectedError& e) {
            return error_response(e);
        }
    });

    // GET /execute/{id}?cursor=N[&ack=1] - poll events
    server.prefix_route("GET", EXECUTE_PREFIX, [ctx](const HttpRequest& req) {
        std::string request_id = request_id_from(req.path);
        if (request_id.empty()) {
            return error_json(404, "NotFound", "no such endpoint");
        }

        try {
            uint64_t cursor = cursor_from(req);
            PollResult poll = ctx.gateway.poll(request_id, cursor);
            if (!poll.found) {
                return error_json(404, "NotFound", "unknown request id");
            }

            auto ack = req.query.find("ack");
            if (poll.done && ack != req.query.end() && (ack->second == "1" || ack->second == "true")) {
                ctx.gateway.acknowledge(request_id);
            }
            return json_response(200, poll_to_json(request_id, poll, ctx.gateway.queue_position(request_id)));
        } catch (const RejectedError& e) {
            return error_response(e);
        }
    });

    // DELETE /execute/{id} - cancel
    server.prefix_route("DELETE", EXECUTE_PREFIX, [ctx](const HttpRequest& req) {
        std::string request_id = request_id_from(req.path);
        if (request_id.empty() || !ctx.gateway.poll(request_id, 0).found) {
            return error_json(404, "NotFound", "unknown request id");
        }

        Json::Value out;
        out["request_id"] = request_id;
        out["cancelled"] = ctx.gateway.cancel(request_id);
        return json_response(200, out);
    });

    // GET /execute/{id}/stream - WebSocket push of the same events
    server.websocket_route(EXECUTE_PREFIX, STREAM_SUFFIX, [ctx](int client_fd, const HttpRequest& req) {
        stream_events(ctx, client_fd, req);
    });

    // POST /v1/exec - codapi-compatible synchronous execution
    server.route("POST", "/v1/exec", [ctx](const HttpRequest& req) {
        try {
            Json::Value body = parse_body(req.body);
            std::string sandbox = required_string(body, "sandbox");
            std::string command = body.isMember("command") ? required_string(body, "command") : "run";
            if (command != "run") {
                throw RejectedError(ErrorCode::BAD_REQUEST, "unsupported command: " + command);
            }
            const Json::Value& files = body["files"];
            if (!files.isObject() || !files[""].isString()) {
                throw RejectedError(ErrorCode::BAD_REQUEST, "'files' must map \"\" to the source");
            }

            ExecutionResult result = ctx.gateway.run_sync(sandbox, files[""].asString(),
                                                          optional_string(body, "stdin"),
                                                          session_id_for(req));
            Json::Value out;
            out["id"] = result.request_id;
            out["ok"] = result.outcome == Outcome::COMPLETED;
            out["duration"] = static_cast<Json::Int64>(result.duration.count());
            out["stdout"] = result.stdout_output;
            out["stderr"] = result.stderr_output;
            out["outcome"] = outcome_to_string(result.outcome);
            out["truncated"] = result.truncated;
            if (!result.message.empty()) {
                out["error"] = result.message;
            }
            return json_response(200, out);
        } catch (const RejectedError& e) {
            return error_response(e);
        }
    });

    // GET /runtimes - languages and their limits
    server.route("GET", "/runtimes", [ctx](const HttpRequest&) {
        Json::Value list(Json::arrayValue);
        for (Language language : ctx.registry.languages()) {
            const RuntimeProfile* profile = ctx.registry.find(language);
            Json::Value entry;
            entry["language"] = language_to_string(language);
            entry["image"] = profile->image_reference;
            entry["available"] = ctx.pool.language_available(language);
            entry["cpu_limit"] = profile->cpu_limit;
            entry["memory_limit_bytes"] = static_cast<Json::UInt64>(profile->memory_limit_bytes);
            entry["wall_clock_ms"] = static_cast<Json::Int64>(profile->wall_clock_limit.count());
            entry["network"] = profile->allow_network;
            list.append(entry);
        }
        Json::Value out;
        out["runtimes"] = list;
        return json_response(200, out);
    });

    // GET /stats - caller quota plus queue and pool counters
    server.route("GET", "/stats", [ctx](const HttpRequest& req) {
        SessionQuota quota = ctx.quota.snapshot(session_id_for(req));
        auto now = std::chrono::steady_clock::now();
        auto reset_ms = quota.window_reset_at > now
            ? std::chrono::duration_cast<std::chrono::milliseconds>(quota.window_reset_at - now).count()
            : 0;

        Json::Value out;
        out["quota"]["tokens_remaining"] = quota.tokens_remaining;
        out["quota"]["concurrent"] = quota.concurrent_count;
        out["quota"]["window_reset_ms"] = static_cast<Json::Int64>(reset_ms);
        out["quota"]["flagged"] = quota.flagged;

        PoolStats pool = ctx.pool.stats();
        out["queue"]["depth"] = static_cast<Json::UInt64>(ctx.scheduler.queue_depth());
        out["workers"]["max"] = static_cast<Json::UInt64>(pool.max_workers);
        out["workers"]["live"] = static_cast<Json::UInt64>(pool.live);
        out["workers"]["ready"] = static_cast<Json::UInt64>(pool.ready);
        out["workers"]["warming"] = static_cast<Json::UInt64>(pool.warming);
        out["workers"]["executing"] = static_cast<Json::UInt64>(pool.executing);
        out["workers"]["executed_total"] = static_cast<Json::UInt64>(pool.executed_total);
        out["isolation"]["namespaces"] = pool.namespaces;
        out["isolation"]["cgroups"] = pool.cgroups;
        return json_response(200, out);
    });

    // GET /health
    server.route("GET", "/health", [](const HttpRequest&) {
        Json::Value out;
        out["status"] = "ok";
        return json_response(200, out);
    });
}

} // namespace sniprun
