#include "mountproxy/protocol/WebSocketCodec.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/protocol/HeaderSet.h"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstdlib>
#include <cstring>

namespace mountproxy {
namespace protocol {

using mountproxy::network::Buffer;

namespace {

const char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string Base64Encode(const unsigned char* data, size_t len) {
    // EVP_EncodeBlock appends a NUL.
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

void FillRandom(unsigned char* p, size_t n) {
    if (RAND_bytes(p, static_cast<int>(n)) != 1) {
        for (size_t i = 0; i < n; ++i) p[i] = static_cast<unsigned char>(std::rand());
    }
}

bool IsControl(uint8_t opcode) { return (opcode & 0x8) != 0; }

} // namespace

WebSocketCodec::DecodeResult WebSocketCodec::fail(uint16_t code, const std::string& why) {
    errorCloseCode_ = code;
    error_ = why;
    return DecodeResult::kError;
}

WebSocketCodec::DecodeResult WebSocketCodec::Decode(Buffer* buf, Message* out) {
    while (true) {
        const size_t avail = buf->ReadableBytes();
        if (avail < 2) return DecodeResult::kNeedMore;
        const unsigned char* p = reinterpret_cast<const unsigned char*>(buf->Peek());

        const bool fin = (p[0] & 0x80) != 0;
        const uint8_t rsv = p[0] & 0x70;
        const uint8_t opcode = p[0] & 0x0F;
        const bool masked = (p[1] & 0x80) != 0;
        uint64_t len = p[1] & 0x7F;
        size_t off = 2;

        if (rsv != 0) return fail(kCloseProtocolError, "reserved bits set without an extension");
        if (masked != serverSide_) {
            return fail(kCloseProtocolError, serverSide_ ? "client frame is not masked" : "server frame is masked");
        }
        if (len == 126) {
            if (avail < off + 2) return DecodeResult::kNeedMore;
            len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
            off += 2;
        } else if (len == 127) {
            if (avail < off + 8) return DecodeResult::kNeedMore;
            len = 0;
            for (int i = 0; i < 8; ++i) len = (len << 8) | p[2 + i];
            off += 8;
            if (len >> 63) return fail(kCloseProtocolError, "frame length has the high bit set");
        }

        if (IsControl(opcode)) {
            if (opcode != kClose && opcode != kPing && opcode != kPong) {
                return fail(kCloseProtocolError, "unknown opcode " + std::to_string(opcode));
            }
            if (!fin) return fail(kCloseProtocolError, "fragmented control frame");
            if (len > 125) return fail(kCloseProtocolError, "control frame payload over 125 bytes");
        } else if (opcode != kContinuation && opcode != kText && opcode != kBinary) {
            return fail(kCloseProtocolError, "unknown opcode " + std::to_string(opcode));
        }
        if (maxMessageSize_ > 0 && fragmentBuffer_.size() + len > maxMessageSize_) {
            return fail(kCloseTooBig, "message exceeds " + std::to_string(maxMessageSize_) + " bytes");
        }

        unsigned char maskKey[4] = {0, 0, 0, 0};
        if (masked) {
            if (avail < off + 4) return DecodeResult::kNeedMore;
            std::memcpy(maskKey, p + off, 4);
            off += 4;
        }
        if (avail - off < len) return DecodeResult::kNeedMore;

        std::string payload(reinterpret_cast<const char*>(p + off), static_cast<size_t>(len));
        if (masked) {
            for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<char>(payload[i] ^ maskKey[i % 4]);
        }
        buf->Retrieve(off + static_cast<size_t>(len));

        if (IsControl(opcode)) {
            out->opcode = static_cast<Opcode>(opcode);
            out->payload.swap(payload);
            return DecodeResult::kMessage;
        }

        if (opcode == kContinuation) {
            if (!inFragmentedMessage_) return fail(kCloseProtocolError, "continuation without a message");
            fragmentBuffer_ += payload;
        } else {
            if (inFragmentedMessage_) return fail(kCloseProtocolError, "new message inside a fragmented one");
            fragmentOpcode_ = static_cast<Opcode>(opcode);
            fragmentBuffer_.swap(payload);
            inFragmentedMessage_ = true;
        }

        if (fin) {
            out->opcode = fragmentOpcode_;
            out->payload.clear();
            out->payload.swap(fragmentBuffer_);
            inFragmentedMessage_ = false;
            return DecodeResult::kMessage;
        }
    }
}

std::string WebSocketCodec::EncodeFrame(Opcode opcode, const std::string& payload, bool mask, bool fin) {
    std::string out;
    out.reserve(payload.size() + 14);
    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | opcode));

    const uint8_t maskBit = mask ? 0x80 : 0x00;
    const uint64_t len = payload.size();
    if (len <= 125) {
        out.push_back(static_cast<char>(maskBit | len));
    } else if (len <= 0xFFFF) {
        out.push_back(static_cast<char>(maskBit | 126));
        out.push_back(static_cast<char>((len >> 8) & 0xFF));
        out.push_back(static_cast<char>(len & 0xFF));
    } else {
        out.push_back(static_cast<char>(maskBit | 127));
        for (int i = 7; i >= 0; --i) out.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }

    if (!mask) {
        out += payload;
        return out;
    }
    unsigned char key[4];
    FillRandom(key, sizeof key);
    out.append(reinterpret_cast<const char*>(key), 4);
    const size_t start = out.size();
    out += payload;
    for (size_t i = 0; i < payload.size(); ++i) {
        out[start + i] = static_cast<char>(out[start + i] ^ key[i % 4]);
    }
    return out;
}

std::string WebSocketCodec::EncodeClose(uint16_t code, const std::string& reason, bool mask) {
    std::string payload;
    if (code != kCloseNoStatus) {
        payload.push_back(static_cast<char>((code >> 8) & 0xFF));
        payload.push_back(static_cast<char>(code & 0xFF));
        payload += reason.substr(0, 123);
    }
    return EncodeFrame(kClose, payload, mask);
}

bool WebSocketCodec::ParseClosePayload(const std::string& payload, uint16_t* code, std::string* reason) {
    reason->clear();
    if (payload.empty()) {
        *code = kCloseNoStatus;
        return true;
    }
    if (payload.size() == 1) return false;
    *code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
    reason->assign(payload, 2, std::string::npos);
    return true;
}

bool WebSocketCodec::IsSendableCloseCode(uint16_t code) {
    if (code >= 3000 && code <= 4999) return true;
    switch (code) {
        case 1000: case 1001: case 1002: case 1003:
        case 1007: case 1008: case 1009: case 1010:
        case 1011: case 1012: case 1013: case 1014:
            return true;
        default:
            return false;
    }
}

std::string WebSocketCodec::ComputeAcceptKey(const std::string& clientKey) {
    const std::string concat = clientKey + kWebSocketGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), digest);
    return Base64Encode(digest, sizeof digest);
}

std::string WebSocketCodec::GenerateClientKey() {
    unsigned char raw[16];
    FillRandom(raw, sizeof raw);
    return Base64Encode(raw, sizeof raw);
}

bool WebSocketCodec::IsUpgradeRequest(const HttpRequest& req) {
    return req.method() == "GET" &&
           HeaderSet::ContainsToken(req.getHeader("Upgrade"), "websocket") &&
           HeaderSet::ContainsToken(req.getHeader("Connection"), "upgrade") &&
           !HeaderSet::Trim(req.getHeader("Sec-WebSocket-Key")).empty();
}

} // namespace protocol
} // namespace mountproxy
