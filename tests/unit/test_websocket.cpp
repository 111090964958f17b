#include <gtest/gtest.h>
#include "websocket.h"

#include <sys/socket.h>
#include <unistd.h>

#include <map>
#include <string>
#include <vector>

namespace sniprun {
namespace {

const char* SAMPLE_KEY = "dGhlIHNhbXBsZSBub25jZQ==";

// ============================================================================
// Upgrade Detection
// ============================================================================

class WebSocketManagerTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> create_headers(
        const std::string& upgrade = "",
        const std::string& connection = "",
        const std::string& key = SAMPLE_KEY
    ) {
        std::map<std::string, std::string> headers;
        if (!upgrade.empty()) headers["upgrade"] = upgrade;
        if (!connection.empty()) headers["connection"] = connection;
        if (!key.empty()) headers["sec-websocket-key"] = key;
        return headers;
    }
};

TEST_F(WebSocketManagerTest, DetectsValidWebSocketUpgrade) {
    // Given: Valid WebSocket upgrade headers
    auto headers = create_headers("websocket", "Upgrade");

    // When: Checking if request is WebSocket upgrade
    bool is_upgrade = WebSocketManager::is_websocket_upgrade(headers);

    // Then: Should recognize as WebSocket upgrade
    EXPECT_TRUE(is_upgrade) << "Valid WebSocket upgrade not detected";
}

TEST_F(WebSocketManagerTest, DetectsUpgradeWithMixedCase) {
    // Given: Header values with mixed case
    auto headers = create_headers("WebSocket", "upgrade");

    // When/Then: Values compare case-insensitively
    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(headers));
}

TEST_F(WebSocketManagerTest, DetectsUpgradeWithConnectionKeepAlive) {
    // Given: Connection header with multiple values including upgrade
    auto headers = create_headers("websocket", "keep-alive, Upgrade");

    // When/Then: Upgrade is found in the comma-separated list
    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(headers));
}

TEST_F(WebSocketManagerTest, RejectsMissingHeaders) {
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_headers("", "Upgrade")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_headers("websocket", "")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_headers("websocket", "Upgrade", "")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade({}));
}

TEST_F(WebSocketManagerTest, RejectsInvalidUpgradeValue) {
    // Given: Headers with wrong Upgrade value
    auto headers = create_headers("h2c", "Upgrade");

    // When/Then: Only websocket upgrades are accepted
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(headers));
}

TEST_F(WebSocketManagerTest, RejectsMalformedKey) {
    // Given: A key that is not 16 base64-encoded bytes
    auto short_key = create_headers("websocket", "Upgrade", "test_key_123");
    auto wrong_size = create_headers("websocket", "Upgrade", "dGhpcyBpcyB0b28gbG9uZyBmb3Ig");

    // When/Then: The upgrade is refused
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(short_key));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(wrong_size));
    EXPECT_TRUE(WebSocketManager::is_valid_key(SAMPLE_KEY));
    // 24 characters, but 18 bytes once decoded
    EXPECT_FALSE(WebSocketManager::is_valid_key("AAAAAAAAAAAAAAAAAAAAAAAA"));
    EXPECT_FALSE(WebSocketManager::is_valid_key("!!!!!!!!!!!!!!!!!!!!!!=="));
}

// ============================================================================
// Handshake
// ============================================================================

TEST_F(WebSocketManagerTest, CreatesValidHandshakeResponse) {
    // Given: A Sec-WebSocket-Key from client
    std::string sec_key = SAMPLE_KEY;

    // When: Creating handshake response
    std::string response = WebSocketManager::create_handshake_response(sec_key);

    // Then: Should have proper HTTP response structure
    EXPECT_EQ(response.find("HTTP/1.1 101 Switching Protocols"), 0u)
        << "Should start with 101 status";
    EXPECT_NE(response.find("Upgrade: websocket"), std::string::npos);
    EXPECT_NE(response.find("Connection: Upgrade"), std::string::npos);
    ASSERT_GE(response.size(), 4u);
    EXPECT_EQ(response.substr(response.size() - 4), "\r\n\r\n");
}

TEST_F(WebSocketManagerTest, CalculatesCorrectAcceptKey) {
    // Given: Known test vector from RFC 6455
    std::string expected_accept = "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=";

    // When: Computing the accept key
    std::string accept = WebSocketManager::compute_accept_key(SAMPLE_KEY);

    // Then: Should match the RFC
    EXPECT_EQ(accept, expected_accept);
    EXPECT_NE(WebSocketManager::create_handshake_response(SAMPLE_KEY)
                  .find("Sec-WebSocket-Accept: " + expected_accept), std::string::npos);
}

TEST_F(WebSocketManagerTest, Base64MatchesKnownVectors) {
    const unsigned char data[] = {'f', 'o', 'o', 'b', 'a', 'r'};

    EXPECT_EQ(WebSocketManager::base64_encode(data, 6), "Zm9vYmFy");
    EXPECT_EQ(WebSocketManager::base64_encode(data, 1), "Zg==");
}

// ============================================================================
// Framing
// ============================================================================

class WebSocketFrameTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
    }

    // Browser frames are always masked
    void send_client_frame(uint8_t opcode, const std::string& payload) {
        const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
        std::vector<uint8_t> frame;
        frame.push_back(0x80 | opcode);
        if (payload.size() <= 125) {
            frame.push_back(0x80 | static_cast<uint8_t>(payload.size()));
        } else {
            frame.push_back(0x80 | 126);
            frame.push_back((payload.size() >> 8) & 0xFF);
            frame.push_back(payload.size() & 0xFF);
        }
        frame.insert(frame.end(), mask, mask + 4);
        for (size_t i = 0; i < payload.size(); ++i) {
            frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
        }
        ASSERT_EQ(write(fds[1], frame.data(), frame.size()), static_cast<ssize_t>(frame.size()));
    }

    int fds[2] = {-1, -1};
};

TEST_F(WebSocketFrameTest, SmallTextFrameLayout) {
    // Given: A short payload
    auto frame = WebSocketManager::create_frame(WSOpcode::TEXT, "hi");

    // Then: FIN + text opcode, unmasked length, payload
    ASSERT_EQ(frame.size(), 4u);
    EXPECT_EQ(frame[0], 0x81);
    EXPECT_EQ(frame[1], 2);
    EXPECT_EQ(frame[2], 'h');
    EXPECT_EQ(frame[3], 'i');
}

TEST_F(WebSocketFrameTest, ExtendedLengths) {
    auto medium = WebSocketManager::create_frame(WSOpcode::TEXT, std::string(300, 'a'));
    ASSERT_EQ(medium.size(), 4u + 300u);
    EXPECT_EQ(medium[1], 126);
    EXPECT_EQ((medium[2] << 8) | medium[3], 300);

    auto large = WebSocketManager::create_frame(WSOpcode::BINARY, std::string(70000, 'b'));
    ASSERT_EQ(large.size(), 10u + 70000u);
    EXPECT_EQ(large[1], 127);
}

TEST_F(WebSocketFrameTest, ReadsMaskedClientText) {
    // Given: A masked text frame from the client
    send_client_frame(0x1, "{\"type\":\"ping\"}");

    // When: Reading it on the server side
    bool is_close = false;
    WSOpcode opcode = WSOpcode::BINARY;
    std::string payload = WebSocketManager::read_frame(fds[0], is_close, &opcode);

    // Then: Payload is unmasked
    EXPECT_FALSE(is_close);
    EXPECT_EQ(opcode, WSOpcode::TEXT);
    EXPECT_EQ(payload, "{\"type\":\"ping\"}");
}

TEST_F(WebSocketFrameTest, ReadsMediumLengthFrame) {
    std::string body(200, 'z');
    send_client_frame(0x1, body);

    bool is_close = false;
    EXPECT_EQ(WebSocketManager::read_frame(fds[0], is_close), body);
    EXPECT_FALSE(is_close);
}

TEST_F(WebSocketFrameTest, PingOpcodeIsReported) {
    send_client_frame(0x9, "beat");

    bool is_close = false;
    WSOpcode opcode = WSOpcode::TEXT;
    std::string payload = WebSocketManager::read_frame(fds[0], is_close, &opcode);

    EXPECT_EQ(opcode, WSOpcode::PING);
    EXPECT_EQ(payload, "beat");
}

TEST_F(WebSocketFrameTest, CloseFrameAndHangupBothClose) {
    // Given: A close frame followed by a hangup
    send_client_frame(0x8, "");

    bool is_close = false;
    WebSocketManager::read_frame(fds[0], is_close);
    EXPECT_TRUE(is_close);

    close(fds[1]);
    fds[1] = -1;
    is_close = false;
    WebSocketManager::read_frame(fds[0], is_close);
    EXPECT_TRUE(is_close);
}

TEST_F(WebSocketFrameTest, OversizedClientFrameIsRefused) {
    // Given: A header announcing a 1MB payload
    const uint8_t header[] = {0x81, 0x80 | 127, 0, 0, 0, 0, 0, 0x10, 0, 0};
    ASSERT_EQ(write(fds[1], header, sizeof(header)), static_cast<ssize_t>(sizeof(header)));

    // When/Then: The connection is treated as closed
    bool is_close = false;
    WebSocketManager::read_frame(fds[0], is_close);
    EXPECT_TRUE(is_close);
}

TEST_F(WebSocketFrameTest, SendCloseCarriesStatusCode) {
    ASSERT_TRUE(WebSocketManager::send_close(fds[0], 1001));

    uint8_t frame[4];
    ASSERT_EQ(read(fds[1], frame, sizeof(frame)), 4);
    EXPECT_EQ(frame[0], 0x88);
    EXPECT_EQ(frame[1], 2);
    EXPECT_EQ((frame[2] << 8) | frame[3], 1001);
}

TEST_F(WebSocketFrameTest, SendTextWritesWholeFrame) {
    ASSERT_TRUE(WebSocketManager::send_text(fds[0], "hello"));

    uint8_t frame[7];
    ASSERT_EQ(read(fds[1], frame, sizeof(frame)), 7);
    EXPECT_EQ(frame[0], 0x81);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(frame + 2), 5), "hello");
}

} // namespace
} // namespace sniprun
