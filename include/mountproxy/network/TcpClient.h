#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/network/InetAddress.h"

#include <memory>
#include <string>

struct ssl_ctx_st;

namespace mountproxy {
namespace network {

class Connector;
class EventLoop;

// One outbound connection, used from its loop's thread. Destroying the
// client closes the connection without further callbacks.
class TcpClient : mountproxy::common::noncopyable {
public:
    TcpClient(EventLoop* loop, const InetAddress& serverAddr, std::string name);
    ~TcpClient();

    void Connect();

    // Client TLS with SNI serverName; must precede Connect().
    void EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyPeer);

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }
    void SetConnectFailedCallback(ConnectFailedCallback cb) { onConnectFailed_ = std::move(cb); }

private:
    void connected(int sockfd);
    void failed(int savedErrno);

    EventLoop* loop_;
    const std::string name_;
    std::shared_ptr<Connector> connector_;
    TcpConnectionPtr connection_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;
    ConnectFailedCallback onConnectFailed_;

    ssl_ctx_st* tlsCtx_;
    std::string tlsServerName_;
    bool tlsVerifyPeer_;
};

} // namespace network
} // namespace mountproxy
