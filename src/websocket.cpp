#include "websocket.h"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <sys/socket.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <memory>
#include <sstream>

namespace sniprun {

namespace {

// Frames larger than this from a client close the connection
constexpr uint64_t MAX_CLIENT_FRAME = 64 * 1024;

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool read_exact(int fd, void* buffer, size_t length) {
    auto* out = static_cast<uint8_t*>(buffer);
    size_t total = 0;
    while (total < length) {
        ssize_t n = read(fd, out + total, length - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += n;
    }
    return true;
}

bool write_frame(int fd, const std::vector<uint8_t>& frame) {
    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += n;
    }
    return true;
}

std::string base64_decode(const std::string& encoded) {
    BioPtr b64(BIO_new(BIO_f_base64()), BIO_free_all);
    BIO* mem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    BIO_push(b64.get(), mem);
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    std::string decoded(encoded.size(), '\0');
    int n = BIO_read(b64.get(), &decoded[0], static_cast<int>(decoded.size()));
    decoded.resize(n > 0 ? n : 0);
    return decoded;
}

} // namespace

std::string WebSocketManager::base64_encode(const unsigned char* data, size_t len) {
    BioPtr b64(BIO_new(BIO_f_base64()), BIO_free_all);
    BIO* mem = BIO_new(BIO_s_mem());
    BIO_push(b64.get(), mem);
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64.get(), data, static_cast<int>(len));
    (void)BIO_flush(b64.get());

    char* encoded = nullptr;
    long encoded_len = BIO_get_mem_data(mem, &encoded);
    return std::string(encoded, encoded_len);
}

bool WebSocketManager::is_websocket_upgrade(const std::map<std::string, std::string>& headers) {
    auto upgrade_it = headers.find("upgrade");
    auto connection_it = headers.find("connection");
    auto key_it = headers.find("sec-websocket-key");

    if (upgrade_it == headers.end() || connection_it == headers.end() || key_it == headers.end()) {
        return false;
    }

    // Case-insensitive comparison
    std::string upgrade = lowercase(upgrade_it->second);
    std::string connection = lowercase(connection_it->second);

    return upgrade == "websocket" && connection.find("upgrade") != std::string::npos &&
           is_valid_key(key_it->second);
}

bool WebSocketManager::is_valid_key(const std::string& sec_key) {
    if (sec_key.size() != 24) {
        return false;
    }
    return base64_decode(sec_key).size() == 16;
}

std::string WebSocketManager::compute_accept_key(const std::string& sec_key) {
    // WebSocket magic string
    const std::string magic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string combined = sec_key + magic;

    // SHA-1 hash
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash);

    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string WebSocketManager::create_handshake_response(const std::string& sec_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << compute_accept_key(sec_key) << "\r\n"
             << "\r\n";

    return response.str();
}

std::vector<uint8_t> WebSocketManager::create_frame(WSOpcode opcode, const std::string& payload) {
    std::vector<uint8_t> frame;

    // First byte: FIN bit + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    // Payload length (server frames are never masked)
    size_t payload_len = payload.size();
    if (payload_len <= 125) {
        frame.push_back(static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(126);
        frame.push_back((payload_len >> 8) & 0xFF);
        frame.push_back(payload_len & 0xFF);
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
        }
    }

    // Payload data
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

bool WebSocketManager::send_text(int client_fd, const std::string& message) {
    return write_frame(client_fd, create_frame(WSOpcode::TEXT, message));
}

bool WebSocketManager::send_close(int client_fd, uint16_t code) {
    std::string payload;
    payload += static_cast<char>((code >> 8) & 0xFF);
    payload += static_cast<char>(code & 0xFF);
    return write_frame(client_fd, create_frame(WSOpcode::CLOSE, payload));
}

bool WebSocketManager::send_pong(int client_fd, const std::string& payload) {
    return write_frame(client_fd, create_frame(WSOpcode::PONG, payload));
}

std::string WebSocketManager::read_frame(int client_fd, bool& is_close, WSOpcode* opcode_out) {
    is_close = false;

    // Read first 2 bytes
    uint8_t header[2];
    if (!read_exact(client_fd, header, 2)) {
        is_close = true;
        return "";
    }

    // Parse opcode
    uint8_t opcode = header[0] & 0x0F;
    if (opcode_out) {
        *opcode_out = static_cast<WSOpcode>(opcode);
    }
    if (opcode == static_cast<uint8_t>(WSOpcode::CLOSE)) {
        is_close = true;
        return "";
    }

    // Parse payload length
    bool masked = (header[1] & 0x80) != 0;
    uint64_t payload_len = header[1] & 0x7F;

    if (payload_len == 126) {
        uint8_t len_bytes[2];
        if (!read_exact(client_fd, len_bytes, 2)) {
            is_close = true;
            return "";
        }
        payload_len = (len_bytes[0] << 8) | len_bytes[1];
    } else if (payload_len == 127) {
        uint8_t len_bytes[8];
        if (!read_exact(client_fd, len_bytes, 8)) {
            is_close = true;
            return "";
        }
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | len_bytes[i];
        }
    }

    if (payload_len > MAX_CLIENT_FRAME) {
        is_close = true;
        return "";
    }

    // Read masking key if present
    uint8_t mask[4] = {0};
    if (masked && !read_exact(client_fd, mask, 4)) {
        is_close = true;
        return "";
    }

    // Read payload
    std::string payload(payload_len, '\0');
    if (payload_len > 0 && !read_exact(client_fd, &payload[0], payload_len)) {
        is_close = true;
        return "";
    }

    // Unmask if needed
    if (masked) {
        for (size_t i = 0; i < payload_len; i++) {
            payload[i] ^= mask[i % 4];
        }
    }

    return payload;
}

} // namespace sniprun
