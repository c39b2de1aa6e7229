#include "mountproxy/protocol/HttpServer.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/protocol/HttpResponse.h"
#include "mountproxy/protocol/WebSocketCodec.h"
#include "mountproxy/common/Logger.h"

#include <exception>

namespace mountproxy {
namespace protocol {

using mountproxy::network::Buffer;
using mountproxy::network::TcpConnection;
using mountproxy::network::TcpConnectionPtr;

HttpServer::HttpServer(mountproxy::network::EventLoop* loop,
                       const mountproxy::network::InetAddress& listenAddr,
                       const std::string& name,
                       mountproxy::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.listenAddress().toIpPort();
    server_.Start();
}

HttpServer::SessionPtr HttpServer::GetSession(const TcpConnectionPtr& conn) {
    const SessionPtr* session = std::any_cast<SessionPtr>(&conn->GetContext());
    return session ? *session : SessionPtr();
}

void HttpServer::SetDisconnectCallback(const TcpConnectionPtr& conn,
                                       const mountproxy::network::ConnectionCallback& cb) {
    SessionPtr session = GetSession(conn);
    if (session) {
        session->disconnectCallback = cb;
    }
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<Session>());
        return;
    }
    SessionPtr session = GetSession(conn);
    if (session && session->disconnectCallback) {
        mountproxy::network::ConnectionCallback cb;
        cb.swap(session->disconnectCallback);
        cb(conn);
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    SessionPtr session = GetSession(conn);
    if (!session) return;

    // Keep-alive / pipelining: drain complete requests until one is left pending.
    while (!session->awaitingResponse && !session->upgraded && !session->closing) {
        if (!session->parser.parseRequest(buf, receiveTime)) {
            LOG_DEBUG << "HttpServer[" << conn->name() << "] bad request";
            session->closing = true;
            conn->Send("HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
            conn->Shutdown();
            return;
        }
        if (!session->parser.gotAll()) {
            return;
        }
        HttpRequest req;
        req.swap(session->parser.request());
        session->parser.reset();
        onRequest(conn, session, req);
    }
}

void HttpServer::onRequest(const TcpConnectionPtr& conn, const SessionPtr& session, const HttpRequest& req) {
    if (upgradeCallback_ && WebSocketCodec::IsUpgradeRequest(req)) {
        session->upgraded = true;
        conn->SetMessageCallback(nullptr);
        try {
            upgradeCallback_(conn, req);
        } catch (const std::exception& e) {
            LOG_ERROR << "HttpServer[" << conn->name() << "] upgrade handler failed: " << e.what();
            conn->ForceClose();
        }
        return;
    }

    const std::string connection = req.getHeader("Connection");
    const bool close = HeaderSet::ContainsToken(connection, "close") ||
                       (req.getVersion() == HttpRequest::kHttp10 && !HeaderSet::ContainsToken(connection, "keep-alive"));
    const bool head = req.method() == "HEAD";

    session->awaitingResponse = true;
    auto done = std::make_shared<bool>(false);
    std::weak_ptr<TcpConnection> weakConn(conn);
    const std::string requestLine = req.method() + " " + req.path();
    const auto received = req.receiveTime();
    Responder respond = [this, weakConn, session, close, head, done, requestLine, received](HttpResponse response) {
        if (*done) {
            LOG_WARN << "HttpServer: response produced twice for " << requestLine << ", ignored";
            return;
        }
        *done = true;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - received);
        LOG_INFO << requestLine << " " << response.statusCode() << " " << elapsed.count() << "ms";
        sendResponse(weakConn, session, std::move(response), close, head);
    };

    session->dispatching = true;
    try {
        if (httpCallback_) {
            httpCallback_(req, respond);
        } else {
            HttpResponse response;
            response.setStatusCode(HttpResponse::k404NotFound);
            respond(std::move(response));
        }
    } catch (const std::exception& e) {
        LOG_ERROR << "HttpServer[" << conn->name() << "] handler failed: " << e.what();
        if (!*done) {
            HttpResponse response(true);
            response.setStatusCode(HttpResponse::k500InternalServerError);
            respond(std::move(response));
        }
    }
    session->dispatching = false;
}

void HttpServer::sendResponse(const std::weak_ptr<TcpConnection>& weakConn,
                              const SessionPtr& session, HttpResponse response, bool close, bool head) {
    TcpConnectionPtr conn = weakConn.lock();
    if (!conn || !conn->connected()) {
        return;
    }
    response.setCloseConnection(close || response.closeConnection());
    response.setHeadRequest(head);

    Buffer out;
    response.appendToBuffer(&out);
    conn->Send(out.Peek(), out.ReadableBytes());

    if (response.closeConnection()) {
        session->closing = true;
        conn->Shutdown();
        return;
    }
    session->awaitingResponse = false;
    // An asynchronous response unblocks requests that were pipelined behind it.
    if (!session->dispatching && conn->inputBuffer()->ReadableBytes() > 0) {
        onMessage(conn, conn->inputBuffer(), std::chrono::system_clock::now());
    }
}

} // namespace protocol
} // namespace mountproxy
