#include "mountproxy/protocol/WebSocketCodec.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/relay/WebSocketRelay.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/common/Logger.h"

#include <cassert>
#include <cstdint>
#include <string>

using namespace mountproxy::protocol;
using mountproxy::network::Buffer;
using mountproxy::relay::WebSocketRelay;
using namespace mountproxy::common;

static std::string maskedFrame(uint8_t b0, const std::string& payload) {
    std::string out;
    out.push_back(static_cast<char>(b0));
    out.push_back(static_cast<char>(0x80 | payload.size()));
    const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
    for (uint8_t m : mask) out.push_back(static_cast<char>(m));
    for (size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return out;
}

void testAcceptKey() {
    assert(WebSocketCodec::ComputeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    const std::string key = WebSocketCodec::GenerateClientKey();
    assert(key.size() == 24);
    assert(key.substr(22) == "==");
    assert(key != WebSocketCodec::GenerateClientKey());
    LOG_INFO << "Accept key PASS";
}

void testServerDecodesMaskedFrames() {
    WebSocketCodec codec(true);
    Buffer buf;
    WebSocketCodec::Message msg;

    const std::string frame = maskedFrame(0x81, "hello");
    buf.Append(frame.substr(0, 4));
    assert(codec.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kNeedMore);
    buf.Append(frame.substr(4));
    assert(codec.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kMessage);
    assert(msg.opcode == WebSocketCodec::kText);
    assert(msg.payload == "hello");
    assert(buf.ReadableBytes() == 0);

    // Fragmented binary message with a ping in the middle.
    buf.Append(maskedFrame(0x02, "ab"));
    buf.Append(maskedFrame(0x89, "p"));
    buf.Append(maskedFrame(0x00, "cd"));
    buf.Append(maskedFrame(0x80, "ef"));
    assert(codec.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kMessage);
    assert(msg.opcode == WebSocketCodec::kPing);
    assert(msg.payload == "p");
    assert(codec.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kMessage);
    assert(msg.opcode == WebSocketCodec::kBinary);
    assert(msg.payload == "abcdef");
    assert(codec.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kNeedMore);
    LOG_INFO << "Server decode PASS";
}

void testClientRoundTripLengths() {
    // Unmasked frames of each length encoding reach a client-side decoder intact.
    const size_t sizes[] = {0, 125, 126, 65535, 65536};
    for (size_t n : sizes) {
        WebSocketCodec client(false);
        Buffer buf;
        const std::string payload(n, 'x');
        buf.Append(WebSocketCodec::EncodeFrame(WebSocketCodec::kBinary, payload, false));
        WebSocketCodec::Message msg;
        assert(client.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kMessage);
        assert(msg.payload.size() == n);
    }

    // Masked output decodes on the server side.
    WebSocketCodec server(true);
    Buffer buf;
    buf.Append(WebSocketCodec::EncodeFrame(WebSocketCodec::kText, "masked", true));
    WebSocketCodec::Message msg;
    assert(server.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kMessage);
    assert(msg.payload == "masked");
    LOG_INFO << "Length encodings PASS";
}

void testProtocolErrors() {
    {
        WebSocketCodec server(true);
        Buffer buf;
        buf.Append(WebSocketCodec::EncodeFrame(WebSocketCodec::kText, "x", false));
        WebSocketCodec::Message msg;
        assert(server.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kError);
        assert(server.errorCloseCode() == WebSocketCodec::kCloseProtocolError);
    }
    {
        WebSocketCodec server(true);
        Buffer buf;
        buf.Append(maskedFrame(0x80, "orphan"));
        WebSocketCodec::Message msg;
        assert(server.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kError);
    }
    {
        WebSocketCodec server(true);
        Buffer buf;
        buf.Append(maskedFrame(0x09, "p"));
        WebSocketCodec::Message msg;
        assert(server.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kError);
    }
    {
        WebSocketCodec server(true);
        server.setMaxMessageSize(4);
        Buffer buf;
        buf.Append(maskedFrame(0x81, "too long"));
        WebSocketCodec::Message msg;
        assert(server.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kError);
        assert(server.errorCloseCode() == WebSocketCodec::kCloseTooBig);
    }
    LOG_INFO << "Protocol errors PASS";
}

void testClosePayload() {
    uint16_t code = 0;
    std::string reason;
    assert(WebSocketCodec::ParseClosePayload("", &code, &reason));
    assert(code == WebSocketCodec::kCloseNoStatus);
    assert(!WebSocketCodec::ParseClosePayload("x", &code, &reason));

    WebSocketCodec client(false);
    Buffer buf;
    buf.Append(WebSocketCodec::EncodeClose(4001, "bye", false));
    WebSocketCodec::Message msg;
    assert(client.Decode(&buf, &msg) == WebSocketCodec::DecodeResult::kMessage);
    assert(msg.opcode == WebSocketCodec::kClose);
    assert(WebSocketCodec::ParseClosePayload(msg.payload, &code, &reason));
    assert(code == 4001);
    assert(reason == "bye");

    assert(WebSocketCodec::IsSendableCloseCode(1000));
    assert(WebSocketCodec::IsSendableCloseCode(1011));
    assert(WebSocketCodec::IsSendableCloseCode(4999));
    assert(!WebSocketCodec::IsSendableCloseCode(1005));
    assert(!WebSocketCodec::IsSendableCloseCode(1006));
    assert(!WebSocketCodec::IsSendableCloseCode(1015));
    LOG_INFO << "Close payload PASS";
}

void testUpgradeDetection() {
    HttpRequest req;
    req.setMethod("GET");
    req.setPath(std::string("/ws"));
    req.headers().add("Upgrade", "WebSocket");
    req.headers().add("Connection", "keep-alive, Upgrade");
    req.headers().add("Sec-WebSocket-Key", "dGhlIHNhbXBsZSBub25jZQ==");
    assert(WebSocketCodec::IsUpgradeRequest(req));

    HttpRequest post = req;
    post.setMethod("POST");
    assert(!WebSocketCodec::IsUpgradeRequest(post));

    HttpRequest plain;
    plain.setMethod("GET");
    plain.headers().add("Connection", "keep-alive");
    assert(!WebSocketCodec::IsUpgradeRequest(plain));
    LOG_INFO << "Upgrade detection PASS";
}

void testRelayHandshakeHelpers() {
    const auto offered = WebSocketRelay::ParseSubprotocols(" v1.marimo , ,json,");
    assert(offered.size() == 2);
    assert(offered[0] == "v1.marimo");
    assert(offered[1] == "json");
    assert(WebSocketRelay::ParseSubprotocols("").empty());

    HeaderSet inbound;
    inbound.add("Cookie", "theme=dark");
    inbound.add("Authorization", "");
    inbound.add("Origin", "https://site");
    inbound.add("Sec-WebSocket-Key", "k");
    const HeaderSet up = WebSocketRelay::UpstreamHandshakeHeaders(inbound);
    assert(up.size() == 1);
    assert(up.value("cookie") == "theme=dark");

    const std::string resp = WebSocketRelay::AcceptResponse("dGhlIHNhbXBsZSBub25jZQ==", "json");
    assert(resp.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
    assert(resp.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);
    assert(resp.find("Sec-WebSocket-Protocol: json\r\n") != std::string::npos);
    assert(WebSocketRelay::AcceptResponse("k", "").find("Sec-WebSocket-Protocol") == std::string::npos);
    LOG_INFO << "Relay handshake helpers PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testAcceptKey();
    testServerDecodesMaskedFrames();
    testClientRoundTripLengths();
    testProtocolErrors();
    testClosePayload();
    testUpgradeDetection();
    testRelayHandshakeHelpers();
    return 0;
}
