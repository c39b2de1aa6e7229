#include "mountproxy/relay/WebSocketChannel.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/network/Timer.h"
#include "mountproxy/common/Logger.h"

namespace mountproxy {
namespace relay {

using protocol::WebSocketCodec;

WebSocketChannel::WebSocketChannel(const network::TcpConnectionPtr& conn, bool serverSide)
    : conn_(conn),
      loop_(conn->getLoop()),
      serverSide_(serverSide),
      codec_(serverSide),
      closeSent_(false),
      closeReceived_(false),
      closed_(false),
      closeCode_(WebSocketCodec::kCloseAbnormal) {
}

WebSocketChannel::~WebSocketChannel() = default;

void WebSocketChannel::OnData(network::Buffer* buf) {
    while (!closed_) {
        WebSocketCodec::Message msg;
        const WebSocketCodec::DecodeResult r = codec_.Decode(buf, &msg);
        if (r == WebSocketCodec::DecodeResult::kNeedMore) {
            return;
        }
        if (r == WebSocketCodec::DecodeResult::kError) {
            LOG_WARN << "WebSocketChannel: " << (serverSide_ ? "client" : "upstream")
                     << " protocol error: " << codec_.error();
            buf->RetrieveAll();
            if (!closeSent_) sendClose(codec_.errorCloseCode(), "");
            forceClose();
            return;
        }

        if (msg.opcode == WebSocketCodec::kText || msg.opcode == WebSocketCodec::kBinary) {
            if (!closeReceived_ && messageCallback_) {
                messageCallback_(msg.opcode, msg.payload);
            }
        } else {
            handleControl(msg);
        }
    }
    buf->RetrieveAll();
}

void WebSocketChannel::handleControl(const WebSocketCodec::Message& msg) {
    switch (msg.opcode) {
        case WebSocketCodec::kPing:
            if (!closeSent_) sendFrame(WebSocketCodec::EncodeFrame(WebSocketCodec::kPong, msg.payload, !serverSide_));
            break;
        case WebSocketCodec::kPong:
            break;
        case WebSocketCodec::kClose: {
            if (closeReceived_) break;
            closeReceived_ = true;
            uint16_t code = WebSocketCodec::kCloseNoStatus;
            std::string reason;
            if (!WebSocketCodec::ParseClosePayload(msg.payload, &code, &reason)) {
                code = WebSocketCodec::kCloseProtocolError;
            }
            closeCode_ = code;
            closeReason_ = reason;
            if (!closeSent_) {
                // Echo the status, as the handshake asks.
                sendClose(WebSocketCodec::IsSendableCloseCode(code) ? code : WebSocketCodec::kCloseNormal, "");
            }
            finishTransport();
            break;
        }
        default:
            break;
    }
}

bool WebSocketChannel::Send(Opcode opcode, const std::string& payload) {
    if (closeSent_ || closed_) return false;
    sendFrame(WebSocketCodec::EncodeFrame(opcode, payload, !serverSide_));
    return true;
}

void WebSocketChannel::Close(uint16_t code, const std::string& reason) {
    if (closeSent_ || closed_) return;
    sendClose(code, reason);
    if (closeReceived_) {
        finishTransport();
    } else {
        startGraceTimer();
    }
}

void WebSocketChannel::OnTransportClosed() {
    if (closed_) return;
    closed_ = true;
    if (graceTimer_) graceTimer_->Cancel();
    ClosedCallback cb;
    cb.swap(closedCallback_);
    messageCallback_ = nullptr;
    if (cb) cb(closeCode_, closeReason_);
}

void WebSocketChannel::sendFrame(const std::string& frame) {
    if (auto conn = conn_.lock()) {
        conn->Send(frame);
    }
}

void WebSocketChannel::sendClose(uint16_t code, const std::string& reason) {
    closeSent_ = true;
    sendFrame(WebSocketCodec::EncodeClose(code, reason, !serverSide_));
}

void WebSocketChannel::finishTransport() {
    // Both close frames are out: half-close and give the peer a moment to hang up.
    if (auto conn = conn_.lock()) {
        conn->Shutdown();
    }
    startGraceTimer();
}

void WebSocketChannel::startGraceTimer() {
    if (closed_) return;
    if (!graceTimer_) graceTimer_.reset(new network::Timer(loop_));
    std::weak_ptr<WebSocketChannel> weak(shared_from_this());
    if (!graceTimer_->Start(kCloseGraceSec, [weak]() {
            if (auto self = weak.lock()) self->forceClose();
        })) {
        forceClose();
    }
}

void WebSocketChannel::forceClose() {
    if (auto conn = conn_.lock()) {
        conn->ForceClose();
    }
}

} // namespace relay
} // namespace mountproxy
