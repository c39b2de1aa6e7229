#include "mountproxy/relay/WebSocketRelay.h"
#include "mountproxy/relay/UpstreamWebSocketClient.h"
#include "mountproxy/relay/UrlTranslator.h"
#include "mountproxy/relay/WebSocketChannel.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/network/TlsContext.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/protocol/HttpServer.h"
#include "mountproxy/protocol/WebSocketCodec.h"
#include "mountproxy/common/Logger.h"

#include <exception>
#include <memory>

namespace mountproxy {
namespace relay {

using network::Buffer;
using network::TcpConnection;
using network::TcpConnectionPtr;
using protocol::HeaderSet;
using protocol::WebSocketCodec;

namespace {

// Output queued toward one side before the other side stops being read.
const size_t kRelayHighWaterMark = 4 * 1024 * 1024;

// Pauses reads on source while sink has more than kRelayHighWaterMark queued.
void Throttle(const TcpConnectionPtr& sink, const TcpConnectionPtr& source) {
    std::weak_ptr<TcpConnection> weakSource(source);
    sink->SetHighWaterMarkCallback([weakSource](const TcpConnectionPtr& conn, size_t queued) {
        if (auto src = weakSource.lock()) {
            LOG_DEBUG << "WebSocketRelay[" << conn->name() << "] " << queued << " bytes queued, pausing "
                      << src->name();
            src->StopRead();
        }
    }, kRelayHighWaterMark);
    sink->SetWriteCompleteCallback([weakSource](const TcpConnectionPtr&) {
        if (auto src = weakSource.lock()) src->StartRead();
    });
}

} // namespace

// One inbound/upstream pair. Everything runs on the inbound connection's loop.
class WebSocketRelay::Session : public std::enable_shared_from_this<WebSocketRelay::Session> {
public:
    Session(const TcpConnectionPtr& conn, std::string clientKey, std::string upstreamUrl)
        : conn_(conn),
          loop_(conn->getLoop()),
          name_(conn->name()),
          clientKey_(std::move(clientKey)),
          upstreamUrl_(std::move(upstreamUrl)),
          state_(State::kPending),
          inboundDone_(false),
          upstreamDone_(false) {
    }

    void Start(const std::shared_ptr<UpstreamWebSocketClient>& upstream,
               const std::vector<std::string>& subprotocols,
               const HeaderSet& headers);

private:
    void onInboundBytes(Buffer* buf);
    void onInboundDisconnected();
    void onUpstreamOpen(bool ok, const std::string& error);
    void onInboundClosed(uint16_t code, const std::string& reason);
    void onUpstreamClosed(uint16_t code, const std::string& reason);
    void bridgeFault(const char* direction, const std::exception& e);
    void setState(State s);
    void maybeFinish();

    std::weak_ptr<TcpConnection> conn_;
    network::EventLoop* loop_;
    const std::string name_;
    const std::string clientKey_;
    const std::string upstreamUrl_;
    State state_;

    std::shared_ptr<UpstreamWebSocketClient> upstream_;
    std::shared_ptr<WebSocketChannel> inbound_;
    bool inboundDone_;
    bool upstreamDone_;
    // Keeps the pair alive until both sides are closed.
    std::shared_ptr<Session> self_;
};

void WebSocketRelay::Session::setState(State s) {
    LOG_DEBUG << "WebSocketRelay[" << name_ << "] " << StateName(state_) << " -> " << StateName(s);
    state_ = s;
}

void WebSocketRelay::Session::Start(const std::shared_ptr<UpstreamWebSocketClient>& upstream,
                                    const std::vector<std::string>& subprotocols,
                                    const HeaderSet& headers) {
    TcpConnectionPtr conn = conn_.lock();
    if (!conn) return;
    self_ = shared_from_this();
    upstream_ = upstream;

    std::shared_ptr<Session> self(self_);
    conn->SetMessageCallback([self](const TcpConnectionPtr&, Buffer* buf, std::chrono::system_clock::time_point) {
        self->onInboundBytes(buf);
    });
    protocol::HttpServer::SetDisconnectCallback(conn, [self](const TcpConnectionPtr&) {
        self->onInboundDisconnected();
    });

    setState(State::kConnecting);
    std::weak_ptr<Session> weak(self_);
    upstream_->Open(upstreamUrl_, subprotocols, headers, [weak](bool ok, const std::string& error) {
        if (auto s = weak.lock()) s->onUpstreamOpen(ok, error);
    });
}

void WebSocketRelay::Session::onInboundBytes(Buffer* buf) {
    if (state_ == State::kBridging || (state_ == State::kClosed && inbound_)) {
        if (inbound_) inbound_->OnData(buf);
    } else if (state_ == State::kClosed) {
        buf->RetrieveAll();
    }
    // While connecting, bytes stay buffered until the inbound side is accepted.
}

void WebSocketRelay::Session::onInboundDisconnected() {
    if (inbound_) {
        inbound_->OnTransportClosed();
        return;
    }
    // Gone before the upstream answered: abandon the attempt.
    LOG_INFO << "WebSocketRelay[" << name_ << "] client left while connecting to " << upstreamUrl_;
    setState(State::kClosed);
    inboundDone_ = true;
    upstreamDone_ = true;
    upstream_.reset();
    maybeFinish();
}

void WebSocketRelay::Session::onUpstreamOpen(bool ok, const std::string& error) {
    if (state_ != State::kConnecting) return;
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) {
        inboundDone_ = true;
        upstreamDone_ = true;
        setState(State::kClosed);
        upstream_.reset();
        maybeFinish();
        return;
    }

    std::weak_ptr<Session> weak(shared_from_this());
    inbound_ = std::make_shared<WebSocketChannel>(conn, true);
    inbound_->SetClosedCallback([weak](uint16_t code, const std::string& reason) {
        if (auto s = weak.lock()) s->onInboundClosed(code, reason);
    });

    if (!ok) {
        LOG_WARN << "WebSocketRelay[" << name_ << "] upstream connect failed: " << upstreamUrl_ << ": " << error;
        conn->Send(AcceptResponse(clientKey_, std::string()));
        setState(State::kClosed);
        upstreamDone_ = true;
        upstream_.reset();
        inbound_->Close(WebSocketCodec::kCloseInternalError, "");
        return;
    }

    std::shared_ptr<WebSocketChannel> upstreamChannel = upstream_->channel();
    conn->Send(AcceptResponse(clientKey_, upstream_->subprotocol()));
    setState(State::kBridging);
    LOG_INFO << "WebSocketRelay[" << name_ << "] bridging to " << upstreamUrl_
             << (upstream_->subprotocol().empty() ? "" : " subprotocol=" + upstream_->subprotocol());

    // client -> upstream
    inbound_->SetMessageCallback([weak](WebSocketChannel::Opcode opcode, const std::string& payload) {
        auto s = weak.lock();
        if (!s || !s->upstream_ || !s->upstream_->channel()) return;
        try {
            s->upstream_->channel()->Send(opcode, payload);
        } catch (const std::exception& e) {
            s->bridgeFault("client->upstream", e);
        }
    });
    // upstream -> client
    upstreamChannel->SetMessageCallback([weak](WebSocketChannel::Opcode opcode, const std::string& payload) {
        auto s = weak.lock();
        if (!s || !s->inbound_) return;
        try {
            s->inbound_->Send(opcode, payload);
        } catch (const std::exception& e) {
            s->bridgeFault("upstream->client", e);
        }
    });
    upstreamChannel->SetClosedCallback([weak](uint16_t code, const std::string& reason) {
        if (auto s = weak.lock()) s->onUpstreamClosed(code, reason);
    });
    if (TcpConnectionPtr upstreamConn = upstreamChannel->connection()) {
        Throttle(conn, upstreamConn);
        Throttle(upstreamConn, conn);
    }

    // Frames the client sent right behind its handshake.
    if (conn->inputBuffer()->ReadableBytes() > 0) {
        inbound_->OnData(conn->inputBuffer());
    }
}

void WebSocketRelay::Session::onInboundClosed(uint16_t code, const std::string& reason) {
    LOG_INFO << "WebSocketRelay[" << name_ << "] client closed code=" << code
             << (reason.empty() ? "" : " reason=" + reason);
    inboundDone_ = true;
    if (state_ == State::kBridging) {
        setState(State::kClosed);
    }
    if (upstream_ && upstream_->channel() && !upstream_->channel()->closed()) {
        upstream_->channel()->Close(WebSocketCodec::kCloseNormal, "");
    } else {
        upstreamDone_ = true;
    }
    maybeFinish();
}

void WebSocketRelay::Session::onUpstreamClosed(uint16_t code, const std::string& reason) {
    LOG_INFO << "WebSocketRelay[" << name_ << "] upstream closed code=" << code
             << (reason.empty() ? "" : " reason=" + reason);
    upstreamDone_ = true;
    if (state_ == State::kBridging) {
        setState(State::kClosed);
    }
    if (inbound_ && !inbound_->closed()) {
        // 1005/1006 never go on the wire; they mean no status was received.
        const uint16_t relayed = WebSocketCodec::IsSendableCloseCode(code) ? code : WebSocketCodec::kCloseNormal;
        inbound_->Close(relayed, reason);
    }
    maybeFinish();
}

void WebSocketRelay::Session::bridgeFault(const char* direction, const std::exception& e) {
    LOG_ERROR << "WebSocketRelay[" << name_ << "] " << direction << " failed: " << e.what();
    setState(State::kClosed);
    if (upstream_ && upstream_->channel()) upstream_->channel()->Close(WebSocketCodec::kCloseInternalError, "");
    if (inbound_) inbound_->Close(WebSocketCodec::kCloseInternalError, "");
}

void WebSocketRelay::Session::maybeFinish() {
    if (!inboundDone_ || !upstreamDone_ || !self_) return;
    LOG_DEBUG << "WebSocketRelay[" << name_ << "] session finished";
    // Released from a fresh stack: we are usually inside a connection callback.
    std::shared_ptr<Session> self;
    self.swap(self_);
    loop_->QueueInLoop([self]() {});
}

WebSocketRelay::WebSocketRelay(const MountOptions& options, network::Resolver* resolver)
    : options_(options),
      resolver_(resolver) {
}

const char* WebSocketRelay::StateName(State state) {
    switch (state) {
        case State::kPending: return "Pending";
        case State::kConnecting: return "Connecting";
        case State::kBridging: return "Bridging";
        case State::kClosed: return "Closed";
    }
    return "Unknown";
}

std::vector<std::string> WebSocketRelay::ParseSubprotocols(const std::string& header) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= header.size()) {
        size_t comma = header.find(',', pos);
        if (comma == std::string::npos) comma = header.size();
        std::string item = HeaderSet::Trim(header.substr(pos, comma - pos));
        if (!item.empty()) out.push_back(std::move(item));
        pos = comma + 1;
    }
    return out;
}

HeaderSet WebSocketRelay::UpstreamHandshakeHeaders(const HeaderSet& inbound) {
    HeaderSet out;
    static const char* const kForwarded[] = {"cookie", "authorization"};
    for (const char* name : kForwarded) {
        const std::string value = inbound.value(name);
        if (!value.empty()) out.add(name, value);
    }
    return out;
}

std::string WebSocketRelay::AcceptResponse(const std::string& clientKey, const std::string& subprotocol) {
    std::string resp = "HTTP/1.1 101 Switching Protocols\r\n"
                       "Upgrade: websocket\r\n"
                       "Connection: Upgrade\r\n"
                       "Sec-WebSocket-Accept: " + WebSocketCodec::ComputeAcceptKey(clientKey) + "\r\n";
    if (!subprotocol.empty()) {
        resp += "Sec-WebSocket-Protocol: " + subprotocol + "\r\n";
    }
    resp += "\r\n";
    return resp;
}

void WebSocketRelay::Handle(const TcpConnectionPtr& conn,
                            const protocol::HttpRequest& request,
                            const std::string& path) {
    if (HeaderSet::Trim(request.getHeader("Sec-WebSocket-Version")) != "13") {
        LOG_DEBUG << "WebSocketRelay[" << conn->name() << "] unsupported version '"
                  << request.getHeader("Sec-WebSocket-Version") << "'";
        conn->Send("HTTP/1.1 426 Upgrade Required\r\n"
                   "Sec-WebSocket-Version: 13\r\n"
                   "Content-Length: 0\r\n"
                   "Connection: close\r\n\r\n");
        conn->Shutdown();
        return;
    }

    const std::string origin = options_.origin ? options_.origin() : std::string(kDefaultOrigin);
    const std::string upstreamUrl = BuildUpstreamUrl(ToWebSocketOrigin(origin), path, request.query());

    UpstreamWebSocketClient::Options clientOptions;
    clientOptions.tlsCtx = options_.upstreamTls ? options_.upstreamTls->ctx() : nullptr;
    clientOptions.verifyPeer = options_.verifyPeer;
    auto upstream = std::make_shared<UpstreamWebSocketClient>(conn->getLoop(), resolver_, clientOptions);

    auto session = std::make_shared<Session>(conn, HeaderSet::Trim(request.getHeader("Sec-WebSocket-Key")), upstreamUrl);
    session->Start(upstream,
                   ParseSubprotocols(request.headers().value("Sec-WebSocket-Protocol")),
                   UpstreamHandshakeHeaders(request.headers()));
}

} // namespace relay
} // namespace mountproxy
