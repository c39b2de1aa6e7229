#include "mountproxy/MountProxyServer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/protocol/HttpResponse.h"
#include "mountproxy/common/Logger.h"

namespace mountproxy {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::HttpServer;

MountProxyServer::MountProxyServer(network::EventLoop* loop,
                                   const network::InetAddress& listenAddr,
                                   const relay::MountOptions& options,
                                   const std::string& name,
                                   network::TcpServer::Option option)
    : loop_(loop),
      options_(options),
      server_(loop, listenAddr, name, option),
      httpRelay_(options_, &resolver_),
      wsRelay_(options_, &resolver_) {
    server_.setHttpCallback(
        std::bind(&MountProxyServer::onRequest, this, std::placeholders::_1, std::placeholders::_2));
    server_.setUpgradeCallback(
        std::bind(&MountProxyServer::onUpgrade, this, std::placeholders::_1, std::placeholders::_2));
}

void MountProxyServer::Start() {
    LOG_INFO << "MountProxyServer: mount " << options_.mount << " -> "
             << (options_.origin ? options_.origin() : std::string(relay::kDefaultOrigin));
    server_.start();
}

MountProxyServer::Route MountProxyServer::Match(const std::string& mount, const std::string& method,
                                                const std::string& path, std::string* rest) {
    std::string base = mount;
    while (!base.empty() && base.back() == '/') base.pop_back();

    if (!base.empty() && path == base) {
        return (method == "GET" || method == "HEAD") ? Route::kRedirect : Route::kNotFound;
    }
    const std::string prefix = base + "/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        if (rest) *rest = path.substr(prefix.size());
        return Route::kRelay;
    }
    return Route::kNotFound;
}

void MountProxyServer::onRequest(const HttpRequest& req, const HttpServer::Responder& respond) {
    std::string rest;
    switch (Match(options_.mount, req.method(), req.path(), &rest)) {
        case Route::kRedirect: {
            LOG_DEBUG << "MountProxyServer: " << req.method() << " " << req.path() << " -> redirect";
            std::string base = options_.mount;
            while (!base.empty() && base.back() == '/') base.pop_back();
            HttpResponse response;
            response.setStatusCode(HttpResponse::k307TemporaryRedirect);
            response.addHeader("Location", base + "/");
            respond(std::move(response));
            return;
        }
        case Route::kRelay: {
            LOG_DEBUG << "MountProxyServer: " << req.method() << " " << req.path() << " -> relay '" << rest << "'";
            network::EventLoop* loop = network::EventLoop::GetEventLoopOfCurrentThread();
            httpRelay_.Handle(loop ? loop : loop_, req, rest, respond);
            return;
        }
        case Route::kNotFound:
            break;
    }
    LOG_DEBUG << "MountProxyServer: " << req.method() << " " << req.path() << " -> 404";
    HttpResponse response;
    response.setStatusCode(HttpResponse::k404NotFound);
    response.setContentType("text/plain; charset=utf-8");
    response.setBody("Not Found");
    respond(std::move(response));
}

void MountProxyServer::onUpgrade(const network::TcpConnectionPtr& conn, const HttpRequest& req) {
    std::string rest;
    if (Match(options_.mount, req.method(), req.path(), &rest) == Route::kRelay) {
        LOG_DEBUG << "MountProxyServer[" << conn->name() << "] websocket " << req.path() << " -> relay '" << rest << "'";
        wsRelay_.Handle(conn, req, rest);
        return;
    }
    LOG_DEBUG << "MountProxyServer[" << conn->name() << "] websocket " << req.path() << " -> 404";
    conn->Send("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    conn->Shutdown();
}

} // namespace mountproxy
