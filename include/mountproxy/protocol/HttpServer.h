#pragma once

#include "mountproxy/network/TcpServer.h"
#include "mountproxy/common/noncopyable.h"
#include "mountproxy/protocol/HttpContext.h"

#include <functional>
#include <memory>

namespace mountproxy {
namespace protocol {

class HttpRequest;
class HttpResponse;

// HTTP/1.1 server with asynchronous responses. Requests on one connection are
// answered in order: parsing pauses until the pending response is written.
class HttpServer : mountproxy::common::noncopyable {
public:
    // Completes the exchange. Call it once, on the connection's loop; later calls are ignored.
    using Responder = std::function<void(HttpResponse)>;
    using HttpCallback = std::function<void(const HttpRequest&, const Responder&)>;
    // Receives WebSocket upgrade requests. The handler owns the connection from then on:
    // it installs its own message callback and finds any bytes that followed the
    // request in conn->inputBuffer().
    using UpgradeCallback = std::function<void(const mountproxy::network::TcpConnectionPtr&, const HttpRequest&)>;

    HttpServer(mountproxy::network::EventLoop* loop,
               const mountproxy::network::InetAddress& listenAddr,
               const std::string& name,
               mountproxy::network::TcpServer::Option option = mountproxy::network::TcpServer::kNoReusePort);

    mountproxy::network::EventLoop* getLoop() const { return server_.getLoop(); }
    mountproxy::network::InetAddress listenAddress() const { return server_.listenAddress(); }
    bool bound() const { return server_.bound(); }

    void setHttpCallback(const HttpCallback& cb) {
        httpCallback_ = cb;
    }

    void setUpgradeCallback(const UpgradeCallback& cb) {
        upgradeCallback_ = cb;
    }

    void setThreadNum(int numThreads) {
        server_.SetThreadNum(numThreads);
    }

    // Terminates TLS on the listener (plain HTTP is still accepted).
    bool enableTls(const std::string& certPemPath, const std::string& keyPemPath) {
        return server_.EnableTls(certPemPath, keyPemPath);
    }

    void start();

    // For upgraded connections: cb runs once when the connection goes down.
    static void SetDisconnectCallback(const mountproxy::network::TcpConnectionPtr& conn,
                                      const mountproxy::network::ConnectionCallback& cb);

private:
    struct Session {
        HttpContext parser;
        bool awaitingResponse{false};
        bool dispatching{false};
        bool upgraded{false};
        bool closing{false};
        mountproxy::network::ConnectionCallback disconnectCallback;
    };
    using SessionPtr = std::shared_ptr<Session>;

    static SessionPtr GetSession(const mountproxy::network::TcpConnectionPtr& conn);

    void onConnection(const mountproxy::network::TcpConnectionPtr& conn);
    void onMessage(const mountproxy::network::TcpConnectionPtr& conn,
                   mountproxy::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void onRequest(const mountproxy::network::TcpConnectionPtr& conn, const SessionPtr& session, const HttpRequest& req);
    void sendResponse(const std::weak_ptr<mountproxy::network::TcpConnection>& weakConn,
                      const SessionPtr& session, HttpResponse response, bool close, bool head);

    mountproxy::network::TcpServer server_;
    HttpCallback httpCallback_;
    UpgradeCallback upgradeCallback_;
};

} // namespace protocol
} // namespace mountproxy
