#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/protocol/HttpResponseContext.h"
#include "mountproxy/protocol/Url.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

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

struct UpstreamRequest {
    std::string method;
    std::string url;
    protocol::HeaderSet headers;
    std::string body;
};

struct UpstreamResult {
    bool ok{false};
    // Transport failure description when !ok.
    std::string error;
    int status{0};
    std::string reason;
    protocol::HeaderSet headers;
    std::string body;
};

// One HTTP/1.1 exchange with the upstream on a fresh connection
// (Connection: close, no redirects followed, bounded by a timeout).
// Lives until it has delivered its result; everything runs on one loop.
class UpstreamHttpClient : mountproxy::common::noncopyable,
                           public std::enable_shared_from_this<UpstreamHttpClient> {
public:
    using ResultCallback = std::function<void(UpstreamResult)>;

    struct Options {
        double timeoutSec{30.0};
        ssl_ctx_st* tlsCtx{nullptr};
        bool verifyPeer{true};
    };

    UpstreamHttpClient(network::EventLoop* loop, network::Resolver* resolver, const Options& options);
    ~UpstreamHttpClient();

    // cb runs exactly once, on the loop, never inline.
    void Fetch(UpstreamRequest request, ResultCallback cb);

    // Request head + body as written to the upstream.
    static std::string SerializeRequest(const UpstreamRequest& request, const protocol::Url& url);

private:
    void onResolved(bool ok, const network::InetAddress& addr, const std::string& error);
    void onConnection(const network::TcpConnectionPtr& conn);
    void onMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf);
    void onTimeout();
    void fail(const std::string& error);
    void finish(UpstreamResult result);

    network::EventLoop* loop_;
    network::Resolver* resolver_;
    Options options_;

    UpstreamRequest request_;
    protocol::Url url_;
    ResultCallback callback_;
    std::shared_ptr<UpstreamHttpClient> self_;

    std::shared_ptr<network::TcpClient> client_;
    std::unique_ptr<network::Timer> timer_;
    protocol::HttpResponseContext parser_;
    bool finished_;
};

} // namespace relay
} // namespace mountproxy
