#pragma once

#include "mountproxy/network/Buffer.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace mountproxy {
namespace protocol {

class HttpRequest;

// RFC 6455 frame codec for one direction of a connection. The server side
// expects masked frames, the client side unmasked ones. Data messages are
// reassembled from fragments; control frames are returned as they arrive,
// even between fragments.
class WebSocketCodec {
public:
    enum Opcode : uint8_t {
        kContinuation = 0x0,
        kText = 0x1,
        kBinary = 0x2,
        kClose = 0x8,
        kPing = 0x9,
        kPong = 0xA,
    };

    enum class DecodeResult { kNeedMore, kMessage, kError };

    struct Message {
        Opcode opcode{kText};
        std::string payload;
    };

    // Close status codes used by the relay.
    static constexpr uint16_t kCloseNormal = 1000;
    static constexpr uint16_t kCloseGoingAway = 1001;
    static constexpr uint16_t kCloseProtocolError = 1002;
    static constexpr uint16_t kCloseNoStatus = 1005;
    static constexpr uint16_t kCloseAbnormal = 1006;
    static constexpr uint16_t kCloseTooBig = 1009;
    static constexpr uint16_t kCloseInternalError = 1011;

    explicit WebSocketCodec(bool serverSide) : serverSide_(serverSide) {}

    // 0 means unlimited.
    void setMaxMessageSize(size_t n) { maxMessageSize_ = n; }

    // Takes one complete message off buf when available.
    DecodeResult Decode(mountproxy::network::Buffer* buf, Message* out);

    // Set after kError: a description and the close code to send back.
    const std::string& error() const { return error_; }
    uint16_t errorCloseCode() const { return errorCloseCode_; }

    // Encodes a single frame; masked with a fresh random key when mask is set.
    static std::string EncodeFrame(Opcode opcode, const std::string& payload, bool mask, bool fin = true);
    // Close frame payload: 2-byte code + reason (reason cut to 123 bytes).
    static std::string EncodeClose(uint16_t code, const std::string& reason, bool mask);
    // Empty payload yields kCloseNoStatus. Returns false for a 1-byte payload.
    static bool ParseClosePayload(const std::string& payload, uint16_t* code, std::string* reason);
    // Codes an endpoint may put on the wire in a close frame.
    static bool IsSendableCloseCode(uint16_t code);

    static std::string ComputeAcceptKey(const std::string& clientKey);
    // 16 random bytes, base64.
    static std::string GenerateClientKey();

    // GET with Upgrade: websocket, Connection: upgrade and a key.
    static bool IsUpgradeRequest(const HttpRequest& req);

private:
    DecodeResult fail(uint16_t code, const std::string& why);

    bool serverSide_;
    size_t maxMessageSize_{0};

    // Reassembly state for fragmented data messages.
    bool inFragmentedMessage_{false};
    Opcode fragmentOpcode_{kText};
    std::string fragmentBuffer_;

    std::string error_;
    uint16_t errorCloseCode_{kCloseProtocolError};
};

} // namespace protocol
} // namespace mountproxy
