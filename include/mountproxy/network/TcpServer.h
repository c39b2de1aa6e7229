#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/network/TlsContext.h"

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>

namespace mountproxy {
namespace network {

class Acceptor;
class EventLoop;
class EventLoopThreadPool;

// Accepts on the base loop and spreads connections over the I/O pool.
// The connection table is only touched on the base loop.
class TcpServer : mountproxy::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Bound address; reports the real port when listening on port 0.
    InetAddress listenAddress() const;
    bool bound() const;

    void SetThreadNum(int numThreads);

    // TLS on the listener. Plain HTTP keeps working on the same port.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Idempotent.
    void Start();

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }

private:
    void accepted(int sockfd, const InetAddress& peer);
    void closed(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> pool_;
    std::shared_ptr<TlsContext> tls_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;

    std::atomic<bool> started_;
    uint64_t nextId_;
    std::unordered_map<std::string, TcpConnectionPtr> connections_;
};

} // namespace network
} // namespace mountproxy
