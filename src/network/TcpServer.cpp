#include "mountproxy/network/TcpServer.h"
#include "mountproxy/network/Acceptor.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/EventLoopThreadPool.h"
#include "mountproxy/common/Logger.h"

namespace mountproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name,
                     Option option)
    : loop_(loop),
      name_(name),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      pool_(new EventLoopThreadPool(loop, name)),
      started_(false),
      nextId_(0) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { accepted(sockfd, peer); });
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer[" << name_ << "] closing " << connections_.size() << " connection(s)";
    for (auto& entry : connections_) {
        TcpConnectionPtr conn = std::move(entry.second);
        conn->getLoop()->RunInLoop([conn] { conn->ConnectDestroyed(); });
    }
    connections_.clear();
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->ListenAddress();
}

bool TcpServer::bound() const {
    return acceptor_->Bound();
}

void TcpServer::SetThreadNum(int numThreads) {
    pool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) {
        return false;
    }
    tls_ = std::move(ctx);
    return true;
}

void TcpServer::Start() {
    if (started_.exchange(true)) {
        return;
    }
    pool_->Start();
    Acceptor* acceptor = acceptor_.get();
    loop_->RunInLoop([acceptor] { acceptor->Listen(); });
}

void TcpServer::accepted(int sockfd, const InetAddress& peer) {
    const std::string connName = name_ + "#" + std::to_string(++nextId_);
    EventLoop* ioLoop = pool_->GetNextLoop();

    LOG_DEBUG << "TcpServer[" << name_ << "] accepted " << connName << " from " << peer.toIpPort();

    auto conn = std::make_shared<TcpConnection>(ioLoop, connName, sockfd, peer, tls_ ? tls_->ctx() : nullptr);
    connections_.emplace(connName, conn);
    conn->SetConnectionCallback(onConnection_);
    conn->SetMessageCallback(onMessage_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { closed(c); });

    ioLoop->RunInLoop([conn] { conn->ConnectEstablished(); });
}

void TcpServer::closed(const TcpConnectionPtr& conn) {
    // Runs on the I/O loop; the table belongs to the base loop. Queue even when
    // they are the same so the erase happens outside the connection's own callback.
    loop_->QueueInLoop([this, conn] {
        connections_.erase(conn->name());
        conn->getLoop()->QueueInLoop([conn] { conn->ConnectDestroyed(); });
    });
}

} // namespace network
} // namespace mountproxy
