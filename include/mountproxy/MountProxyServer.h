#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/network/Resolver.h"
#include "mountproxy/network/TcpServer.h"
#include "mountproxy/protocol/HttpServer.h"
#include "mountproxy/relay/HttpRelay.h"
#include "mountproxy/relay/MountOptions.h"
#include "mountproxy/relay/WebSocketRelay.h"

#include <memory>
#include <string>

namespace mountproxy {

// Serves one mounted application: `GET {mount}` redirects to `{mount}/`,
// everything under `{mount}/` is relayed to the upstream origin (WebSocket
// upgrades included) and all other paths are 404.
class MountProxyServer : mountproxy::common::noncopyable {
public:
    MountProxyServer(network::EventLoop* loop,
                     const network::InetAddress& listenAddr,
                     const relay::MountOptions& options,
                     const std::string& name = "MountProxy",
                     network::TcpServer::Option option = network::TcpServer::kNoReusePort);

    void SetThreadNum(int numThreads) { server_.setThreadNum(numThreads); }
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
        return server_.enableTls(certPemPath, keyPemPath);
    }
    void Start();

    network::InetAddress listenAddress() const { return server_.listenAddress(); }
    bool bound() const { return server_.bound(); }
    const relay::MountOptions& options() const { return options_; }

    enum class Route { kRedirect, kRelay, kNotFound };
    // Classifies a request path; *rest gets the part after "{mount}/" for kRelay.
    static Route Match(const std::string& mount, const std::string& method,
                       const std::string& path, std::string* rest);

private:
    void onRequest(const protocol::HttpRequest& req, const protocol::HttpServer::Responder& respond);
    void onUpgrade(const network::TcpConnectionPtr& conn, const protocol::HttpRequest& req);

    network::EventLoop* loop_;
    relay::MountOptions options_;
    // Declared before the relays that post lookups to it.
    network::Resolver resolver_;
    protocol::HttpServer server_;
    relay::HttpRelay httpRelay_;
    relay::WebSocketRelay wsRelay_;
};

} // namespace mountproxy
