#include "mountproxy/relay/UpstreamWebSocketClient.h"
#include "mountproxy/relay/WebSocketChannel.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/Resolver.h"
#include "mountproxy/network/TcpClient.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/network/Timer.h"
#include "mountproxy/protocol/WebSocketCodec.h"
#include "mountproxy/common/Logger.h"

#include <sstream>

namespace mountproxy {
namespace relay {

using network::Buffer;
using network::TcpConnectionPtr;
using protocol::HeaderSet;
using protocol::WebSocketCodec;

UpstreamWebSocketClient::UpstreamWebSocketClient(network::EventLoop* loop,
                                                 network::Resolver* resolver,
                                                 const Options& options)
    : loop_(loop),
      resolver_(resolver),
      options_(options),
      opening_(false) {
}

UpstreamWebSocketClient::~UpstreamWebSocketClient() = default;

std::string UpstreamWebSocketClient::SerializeHandshake(const protocol::Url& url,
                                                        const std::string& key,
                                                        const std::vector<std::string>& subprotocols,
                                                        const HeaderSet& headers) {
    std::ostringstream os;
    os << "GET " << url.target << " HTTP/1.1\r\n"
       << "Host: " << url.hostHeader() << "\r\n"
       << "Upgrade: websocket\r\n"
       << "Connection: Upgrade\r\n"
       << "Sec-WebSocket-Key: " << key << "\r\n"
       << "Sec-WebSocket-Version: 13\r\n";
    if (!subprotocols.empty()) {
        os << "Sec-WebSocket-Protocol: ";
        for (size_t i = 0; i < subprotocols.size(); ++i) {
            if (i > 0) os << ", ";
            os << subprotocols[i];
        }
        os << "\r\n";
    }
    for (const auto& h : headers) {
        os << h.first << ": " << h.second << "\r\n";
    }
    os << "\r\n";
    return os.str();
}

bool UpstreamWebSocketClient::VerifyHandshake(const protocol::HttpResponseContext& response,
                                              const std::string& key,
                                              const std::vector<std::string>& offered,
                                              std::string* subprotocol,
                                              std::string* error) {
    if (response.statusCode() != 101) {
        *error = "server rejected WebSocket connection: HTTP " + std::to_string(response.statusCode());
        return false;
    }
    const HeaderSet& h = response.headers();
    if (!HeaderSet::ContainsToken(h.value("Upgrade"), "websocket")) {
        *error = "invalid Upgrade header: " + h.value("Upgrade");
        return false;
    }
    if (!HeaderSet::ContainsToken(h.value("Connection"), "upgrade")) {
        *error = "invalid Connection header: " + h.value("Connection");
        return false;
    }
    if (HeaderSet::Trim(h.value("Sec-WebSocket-Accept")) != WebSocketCodec::ComputeAcceptKey(key)) {
        *error = "invalid Sec-WebSocket-Accept header";
        return false;
    }
    const std::string selected = HeaderSet::Trim(h.value("Sec-WebSocket-Protocol"));
    if (!selected.empty()) {
        bool wasOffered = false;
        for (const auto& p : offered) {
            if (p == selected) wasOffered = true;
        }
        if (!wasOffered) {
            *error = "unsupported subprotocol: " + selected;
            return false;
        }
    }
    *subprotocol = selected;
    return true;
}

void UpstreamWebSocketClient::Open(const std::string& url,
                                   const std::vector<std::string>& subprotocols,
                                   const HeaderSet& headers,
                                   OpenCallback cb) {
    openCallback_ = std::move(cb);
    subprotocols_ = subprotocols;
    headers_ = headers;
    opening_ = true;

    std::string error;
    if (!protocol::Url::Parse(url, &url_, &error)) {
        fail(error);
        return;
    }
    if (url_.scheme != "ws" && url_.scheme != "wss") {
        fail("unsupported URL scheme '" + url_.scheme + "' for a WebSocket");
        return;
    }
    if (url_.secure() && !options_.tlsCtx) {
        fail("TLS is not configured for upstream " + url_.hostHeader());
        return;
    }
    key_ = WebSocketCodec::GenerateClientKey();
    parser_.reset();
    parser_.setRequestMethod("GET");

    std::weak_ptr<UpstreamWebSocketClient> weak(shared_from_this());
    timer_.reset(new network::Timer(loop_));
    if (!timer_->Start(options_.openTimeoutSec, [weak]() {
            if (auto self = weak.lock()) self->fail("timed out during opening handshake");
        })) {
        LOG_WARN << "UpstreamWebSocketClient: opening " << url_.toString() << " without a timeout";
    }

    resolver_->Resolve(loop_, url_.host, url_.port,
                       [weak](bool ok, const network::InetAddress& addr, const std::string& err) {
                           if (auto self = weak.lock()) self->onResolved(ok, addr, err);
                       });
}

void UpstreamWebSocketClient::onResolved(bool ok, const network::InetAddress& addr, const std::string& error) {
    if (!opening_) return;
    if (!ok) {
        fail(error);
        return;
    }

    client_ = std::make_shared<network::TcpClient>(loop_, addr, "upstream-ws");
    if (url_.secure()) {
        client_->EnableTls(options_.tlsCtx, url_.host, options_.verifyPeer);
    }
    std::weak_ptr<UpstreamWebSocketClient> weak(shared_from_this());
    client_->SetConnectionCallback([weak](const TcpConnectionPtr& conn) {
        if (auto self = weak.lock()) self->onConnection(conn);
    });
    client_->SetMessageCallback([weak](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
        if (auto self = weak.lock()) self->onMessage(conn, buf);
    });
    client_->SetConnectFailedCallback([weak](const std::string& reason) {
        if (auto self = weak.lock()) self->fail(reason);
    });
    client_->Connect();
}

void UpstreamWebSocketClient::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        if (!opening_) return;
        conn->SetTcpNoDelay(true);
        conn->Send(SerializeHandshake(url_, key_, subprotocols_, headers_));
        return;
    }
    if (channel_) {
        channel_->OnTransportClosed();
        return;
    }
    if (opening_) {
        const std::string why = conn->lastError().empty() ? std::string("connection closed") : conn->lastError();
        fail("upstream " + url_.hostHeader() + " closed during opening handshake: " + why);
    }
}

void UpstreamWebSocketClient::onMessage(const TcpConnectionPtr& conn, Buffer* buf) {
    if (channel_) {
        channel_->OnData(buf);
        return;
    }
    if (!opening_) {
        buf->RetrieveAll();
        return;
    }
    if (!parser_.parseResponse(buf)) {
        fail("malformed handshake response: " + parser_.error());
        return;
    }
    if (!parser_.gotAll()) return;

    std::string error;
    if (!VerifyHandshake(parser_, key_, subprotocols_, &subprotocol_, &error)) {
        fail(error);
        return;
    }

    channel_ = std::make_shared<WebSocketChannel>(conn, false);
    complete(true, std::string());
    // Frames that arrived with the handshake response wait in buf until the owner
    // has installed its callbacks.
    std::weak_ptr<UpstreamWebSocketClient> weak(shared_from_this());
    loop_->QueueInLoop([weak, conn]() {
        auto self = weak.lock();
        if (self && self->channel_ && conn->inputBuffer()->ReadableBytes() > 0) {
            self->channel_->OnData(conn->inputBuffer());
        }
    });
}

void UpstreamWebSocketClient::fail(const std::string& error) {
    if (!opening_) return;
    LOG_DEBUG << "UpstreamWebSocketClient: " << error;
    std::shared_ptr<network::TcpClient> client;
    client.swap(client_);
    if (client) {
        // Drop the connection from a fresh stack; we may be inside its callbacks.
        loop_->QueueInLoop([client]() {});
    }
    complete(false, error);
}

void UpstreamWebSocketClient::complete(bool ok, const std::string& error) {
    opening_ = false;
    if (timer_) timer_->Cancel();
    OpenCallback cb;
    cb.swap(openCallback_);
    if (cb) {
        loop_->QueueInLoop([cb, ok, error]() { cb(ok, error); });
    }
}

} // namespace relay
} // namespace mountproxy
