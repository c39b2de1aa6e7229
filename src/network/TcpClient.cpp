#include "mountproxy/network/TcpClient.h"
#include "mountproxy/network/Connector.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/Socket.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/common/Logger.h"

#include <unistd.h>

#include <cstring>

namespace mountproxy {
namespace network {

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, std::string name)
    : loop_(loop),
      name_(std::move(name)),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      tlsCtx_(nullptr),
      tlsVerifyPeer_(true) {
    connector_->SetConnectedCallback([this](int sockfd) { connected(sockfd); });
    connector_->SetFailedCallback([this](int savedErrno) { failed(savedErrno); });
}

TcpClient::~TcpClient() {
    // Work already queued may still reach the connector after we are gone.
    connector_->SetConnectedCallback([](int sockfd) { ::close(sockfd); });
    connector_->SetFailedCallback(nullptr);

    if (!connection_) {
        connector_->Cancel();
        return;
    }
    TcpConnectionPtr conn = std::move(connection_);
    EventLoop* loop = loop_;
    loop_->RunInLoop([conn, loop] {
        conn->SetConnectionCallback(nullptr);
        conn->SetMessageCallback(nullptr);
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
            loop->QueueInLoop([c] { c->ConnectDestroyed(); });
        });
        conn->ForceClose();
    });
}

void TcpClient::EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyPeer) {
    tlsCtx_ = ctx;
    tlsServerName_ = serverName;
    tlsVerifyPeer_ = verifyPeer;
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient[" << name_ << "] connecting to " << connector_->serverAddress().toIpPort();
    connector_->Start();
}

void TcpClient::connected(int sockfd) {
    const InetAddress peer = Socket::PeerAddress(sockfd);
    auto conn = std::make_shared<TcpConnection>(loop_, name_ + "@" + peer.toIpPort(), sockfd, peer);
    if (tlsCtx_) {
        conn->SetClientTls(tlsCtx_, tlsServerName_, tlsVerifyPeer_);
    }
    conn->SetConnectionCallback(onConnection_);
    conn->SetMessageCallback(onMessage_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) {
        connection_.reset();
        loop_->QueueInLoop([c] { c->ConnectDestroyed(); });
    });
    connection_ = conn;
    conn->ConnectEstablished();
}

void TcpClient::failed(int savedErrno) {
    const std::string reason = "connect to " + connector_->serverAddress().toIpPort() + " failed: "
                               + std::strerror(savedErrno);
    LOG_DEBUG << "TcpClient[" << name_ << "] " << reason;
    if (onConnectFailed_) {
        onConnectFailed_(reason);
    }
}

} // namespace network
} // namespace mountproxy
