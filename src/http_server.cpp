#include "http_server.h"
#include "log.h"
#include "websocket.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cctype>
#include <cstring>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace sniprun {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

bool write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += n;
    }
    return true;
}

std::string error_body(const std::string& error, const std::string& message) {
    return "{\"error\":\"" + error + "\",\"message\":\"" + message + "\"}";
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

HttpServer::HttpServer(int port, size_t max_connections)
    : port_(port), max_connections_(max_connections), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::prefix_route(const std::string& method, const std::string& prefix, HandlerFunc handler) {
    prefix_routes_.push_back({method, prefix, handler});
}

void HttpServer::websocket_route(const std::string& prefix, const std::string& suffix,
                                 WebSocketHandler handler) {
    websocket_routes_.push_back({prefix, suffix, handler});
}

void HttpServer::bind_and_listen() {
    if (server_fd_ >= 0) return;

    // Create socket
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    // Learn the actual port when 0 was requested
    socklen_t len = sizeof(addr);
    if (getsockname(fd, (struct sockaddr*)&addr, &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
}

void HttpServer::start() {
    bind_and_listen();
    log::info("HTTP", "Server listening on port " + std::to_string(port_));

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && (errno == EINTR || errno == ECONNABORTED || errno == EMFILE)) continue;
            break;
        }

        // Slow or silent clients must not hold a thread forever
        struct timeval timeout;
        timeout.tv_sec = CLIENT_IO_TIMEOUT_SECONDS;
        timeout.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        if (active_connections_ >= max_connections_) {
            HttpResponse busy;
            busy.status_code = 503;
            busy.headers["Retry-After"] = "1";
            busy.body = error_body("ServiceBusy", "too many connections");
            write_all(client_fd, build_response(busy));
            close(client_fd);
            continue;
        }

        // Get client IP
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        // Handle in new thread (simple concurrency)
        active_connections_++;
        std::thread([this, client_fd, client_ip]() {
            try {
                handle_client(client_fd, client_ip);
            } catch (const std::exception& e) {
                log::error("HTTP", std::string("connection handler failed: ") + e.what());
            }
            close(client_fd);

            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_--;
            connections_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // Wake the blocked accept()
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }

    // Connection threads are detached and use this object
    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_cv_.wait(lock, [this] { return active_connections_ == 0; });
}

void HttpServer::stop_accepting() {
    running_ = false;
    int fd = server_fd_.load();
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
    }
}

bool HttpServer::read_request(int client_fd, std::string& request_data, int& error_status) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    // Read until the headers are complete
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read <= 0) return false;

        request_data.append(buffer, bytes_read);
        if (request_data.size() > MAX_REQUEST_SIZE) {
            error_status = 413;
            return false;
        }
        header_end = request_data.find("\r\n\r\n");
    }
    header_end += 4;

    // Then read the body announced by Content-Length
    std::string head = to_lower(request_data.substr(0, header_end));
    size_t content_length = 0;
    size_t pos = head.find("\r\ncontent-length:");
    if (pos != std::string::npos) {
        size_t value_start = pos + 17;
        size_t line_end = head.find("\r\n", value_start);
        try {
            content_length = std::stoul(trim(head.substr(value_start, line_end - value_start)));
        } catch (const std::exception&) {
            error_status = 400;
            return false;
        }
    }

    size_t expected_size = header_end + content_length;
    if (expected_size > MAX_REQUEST_SIZE) {
        error_status = 413;
        return false;
    }

    while (request_data.size() < expected_size) {
        bytes_read = read(client_fd, buffer,
            std::min(sizeof(buffer), expected_size - request_data.size()));
        if (bytes_read <= 0) return false;
        request_data.append(buffer, bytes_read);
    }
    return true;
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    int error_status = 0;

    if (!read_request(client_fd, request_data, error_status)) {
        if (error_status != 0) {
            HttpResponse resp;
            resp.status_code = error_status;
            resp.body = error_status == 413
                ? error_body("PayloadTooLarge", "request exceeds " + std::to_string(MAX_REQUEST_SIZE) + " bytes")
                : error_body("BadRequest", "malformed request");
            write_all(client_fd, build_response(resp));
        }
        return;
    }

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    if (const WebSocketRoute* ws = find_websocket_route(req)) {
        if (!WebSocketManager::is_websocket_upgrade(req.headers)) {
            HttpResponse resp;
            resp.status_code = 400;
            resp.body = error_body("BadRequest", "websocket upgrade required");
            write_all(client_fd, build_response(resp));
            return;
        }
        ws->handler(client_fd, req);
        return;
    }

    HttpResponse resp = dispatch(req);

    // Send response
    write_all(client_fd, build_response(resp));
}

const HttpServer::WebSocketRoute* HttpServer::find_websocket_route(const HttpRequest& req) const {
    if (req.method != "GET") return nullptr;

    for (const auto& ws : websocket_routes_) {
        const std::string& path = req.path;
        if (path.size() > ws.prefix.size() + ws.suffix.size() &&
            path.compare(0, ws.prefix.size(), ws.prefix) == 0 &&
            path.compare(path.size() - ws.suffix.size(), ws.suffix.size(), ws.suffix) == 0) {
            return &ws;
        }
    }
    return nullptr;
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) {
    HttpResponse resp;
    const HandlerFunc* handler = nullptr;

    // Check for exact match
    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        handler = &it->second;
    } else {
        // Longest matching prefix (for /execute/{id} style routes)
        size_t best = 0;
        for (const auto& route : prefix_routes_) {
            if (route.method == req.method && req.path.compare(0, route.prefix.size(), route.prefix) == 0 &&
                route.prefix.size() > best) {
                best = route.prefix.size();
                handler = &route.handler;
            }
        }
    }

    if (!handler) {
        resp.status_code = 404;
        resp.body = error_body("NotFound", "no such endpoint");
        return resp;
    }

    try {
        resp = (*handler)(req);
    } catch (const std::exception& e) {
        // Details go to the log only
        log::alert("HTTP", req.method + " " + req.path + " failed: " + e.what());
        resp = HttpResponse();
        resp.status_code = 500;
        resp.body = error_body("InternalError", "internal error");
    }
    return resp;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;
    std::istringstream stream(raw);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);

        size_t question = target.find('?');
        req.path = target.substr(0, question);
        if (question != std::string::npos) {
            std::istringstream params(target.substr(question + 1));
            std::string pair;
            while (std::getline(params, pair, '&')) {
                if (pair.empty()) continue;
                size_t eq = pair.find('=');
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
                req.query[key] = value;
            }
        }
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r" && !line.empty()) {
        if (line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
    }

    // Rest is body, byte for byte
    size_t body_start = raw.find("\r\n\r\n");
    if (body_start != std::string::npos) {
        req.body = raw.substr(body_start + 4);
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace sniprun
