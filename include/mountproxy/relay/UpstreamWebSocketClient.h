#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/protocol/HttpResponseContext.h"
#include "mountproxy/protocol/Url.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ssl_ctx_st;

namespace mountproxy {
namespace network {
class Buffer;
class EventLoop;
class Resolver;
class TcpClient;
class Timer;
} // namespace network

namespace relay {

class WebSocketChannel;

// Opens a WebSocket to the upstream (ws:// or wss://) and, once the opening
// handshake is verified, exposes it as a client-side WebSocketChannel.
// Destroying the client drops the connection.
class UpstreamWebSocketClient : mountproxy::common::noncopyable,
                                public std::enable_shared_from_this<UpstreamWebSocketClient> {
public:
    using OpenCallback = std::function<void(bool ok, const std::string& error)>;

    struct Options {
        // Bounds DNS + connect + TLS + opening handshake.
        double openTimeoutSec{10.0};
        ssl_ctx_st* tlsCtx{nullptr};
        bool verifyPeer{true};
    };

    UpstreamWebSocketClient(network::EventLoop* loop, network::Resolver* resolver, const Options& options);
    ~UpstreamWebSocketClient();

    // cb runs once, on the loop, never inline. Messages are not size limited.
    void Open(const std::string& url,
              const std::vector<std::string>& subprotocols,
              const protocol::HeaderSet& headers,
              OpenCallback cb);

    // Subprotocol the upstream selected; empty when none.
    const std::string& subprotocol() const { return subprotocol_; }
    const std::shared_ptr<WebSocketChannel>& channel() const { return channel_; }

    static std::string SerializeHandshake(const protocol::Url& url,
                                          const std::string& key,
                                          const std::vector<std::string>& subprotocols,
                                          const protocol::HeaderSet& headers);

    // Checks a parsed handshake response against what was offered.
    static bool VerifyHandshake(const protocol::HttpResponseContext& response,
                                const std::string& key,
                                const std::vector<std::string>& offered,
                                std::string* subprotocol,
                                std::string* error);

private:
    void onResolved(bool ok, const network::InetAddress& addr, const std::string& error);
    void onConnection(const network::TcpConnectionPtr& conn);
    void onMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf);
    void fail(const std::string& error);
    void complete(bool ok, const std::string& error);

    network::EventLoop* loop_;
    network::Resolver* resolver_;
    Options options_;

    protocol::Url url_;
    std::string key_;
    std::vector<std::string> subprotocols_;
    protocol::HeaderSet headers_;
    OpenCallback openCallback_;

    std::shared_ptr<network::TcpClient> client_;
    std::unique_ptr<network::Timer> timer_;
    protocol::HttpResponseContext parser_;
    std::shared_ptr<WebSocketChannel> channel_;
    std::string subprotocol_;
    bool opening_;
};

} // namespace relay
} // namespace mountproxy
