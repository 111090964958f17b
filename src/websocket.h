#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sniprun {

// WebSocket frame opcodes
enum class WSOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// Server side of RFC 6455, just enough to push JSON events to a browser
class WebSocketManager {
public:
    // Check if request is WebSocket upgrade (header names lowercased)
    static bool is_websocket_upgrade(const std::map<std::string, std::string>& headers);

    // Sec-WebSocket-Key must be 16 random bytes, base64 encoded
    static bool is_valid_key(const std::string& sec_key);

    // Perform WebSocket handshake
    static std::string compute_accept_key(const std::string& sec_key);
    static std::string create_handshake_response(const std::string& sec_key);

    // Send text frame to client
    static bool send_text(int client_fd, const std::string& message);

    // Send close frame with an optional status code
    static bool send_close(int client_fd, uint16_t code = 1000);

    static bool send_pong(int client_fd, const std::string& payload);

    // Read and decode one incoming frame. `opcode` gets the frame type;
    // is_close is set on a close frame or a broken connection.
    static std::string read_frame(int client_fd, bool& is_close, WSOpcode* opcode = nullptr);

    // Frame encoding, exposed for tests
    static std::vector<uint8_t> create_frame(WSOpcode opcode, const std::string& payload);

    static std::string base64_encode(const unsigned char* data, size_t len);
};

} // namespace sniprun
