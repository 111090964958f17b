#pragma once

#include "constants.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sniprun {

// Simple HTTP request. Header names are lowercased.
struct HttpRequest {
    std::string method;
    std::string path;                              // Without the query string
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Takes over the connection after the upgrade request has been read. The
// handler owns the protocol from there; the server closes the fd afterwards.
using WebSocketHandler = std::function<void(int client_fd, const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per connection
class HttpServer {
public:
    explicit HttpServer(int port = DEFAULT_PORT, size_t max_connections = MAX_CONNECTIONS);
    ~HttpServer();

    // Exact path match
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Matches every path starting with `prefix` (longest prefix wins)
    void prefix_route(const std::string& method, const std::string& prefix, HandlerFunc handler);

    // GET upgrade requests whose path starts with `prefix` and ends with `suffix`
    void websocket_route(const std::string& prefix, const std::string& suffix, WebSocketHandler handler);

    // Bind and listen. Port 0 picks a free port, see port().
    void bind_and_listen();

    // Accept loop (blocks until stop()). Calls bind_and_listen() if needed.
    void start();

    // Stop accepting and wait for open connections to finish. A handler
    // blocked on a request result holds this up, so stop the scheduler and
    // the worker pool first.
    void stop();

    // Make start() return. Async-signal-safe.
    void stop_accepting();

    int port() const { return port_; }
    bool running() const { return running_; }
    size_t active_connections() const { return active_connections_; }

private:
    struct PrefixRoute {
        std::string method;
        std::string prefix;
        HandlerFunc handler;
    };
    struct WebSocketRoute {
        std::string prefix;
        std::string suffix;
        WebSocketHandler handler;
    };

    int port_;
    size_t max_connections_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;
    std::vector<PrefixRoute> prefix_routes_;
    std::vector<WebSocketRoute> websocket_routes_;

    std::atomic<size_t> active_connections_{0};
    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;

    void handle_client(int client_fd, const std::string& client_ip);
    bool read_request(int client_fd, std::string& raw, int& error_status);
    HttpResponse dispatch(const HttpRequest& req);
    const WebSocketRoute* find_websocket_route(const HttpRequest& req) const;

public:
    // Exposed for tests
    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);
};

} // namespace sniprun
