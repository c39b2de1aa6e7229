#include "mountproxy/relay/UpstreamHttpClient.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/Resolver.h"
#include "mountproxy/network/TcpClient.h"
#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/network/Timer.h"
#include "mountproxy/common/Logger.h"

#include <sstream>

namespace mountproxy {
namespace relay {

using network::Buffer;
using network::TcpConnectionPtr;
using protocol::HeaderSet;

namespace {

bool MethodExpectsBody(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

// Only codings the relay can decode before rewriting are offered upstream.
std::string NarrowAcceptEncoding(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        const std::string item = HeaderSet::Trim(value.substr(pos, comma - pos));
        const std::string coding = HeaderSet::ToLower(HeaderSet::Trim(item.substr(0, item.find(';'))));
        if (coding == "gzip" || coding == "deflate" || coding == "identity") {
            if (!out.empty()) out += ", ";
            out += item;
        }
        pos = comma + 1;
    }
    return out;
}

} // namespace

UpstreamHttpClient::UpstreamHttpClient(network::EventLoop* loop, network::Resolver* resolver, const Options& options)
    : loop_(loop),
      resolver_(resolver),
      options_(options),
      finished_(false) {
}

UpstreamHttpClient::~UpstreamHttpClient() = default;

std::string UpstreamHttpClient::SerializeRequest(const UpstreamRequest& request, const protocol::Url& url) {
    std::ostringstream os;
    os << request.method << ' ' << url.target << " HTTP/1.1\r\n";
    os << "Host: " << url.hostHeader() << "\r\n";
    for (const auto& h : request.headers) {
        if (HeaderSet::IEquals(h.first, "Host") ||
            HeaderSet::IEquals(h.first, "Content-Length") ||
            HeaderSet::IEquals(h.first, "Connection")) {
            continue;
        }
        if (HeaderSet::IEquals(h.first, "Accept-Encoding")) {
            const std::string narrowed = NarrowAcceptEncoding(h.second);
            if (!narrowed.empty()) os << h.first << ": " << narrowed << "\r\n";
            continue;
        }
        os << h.first << ": " << h.second << "\r\n";
    }
    if (!request.body.empty() || MethodExpectsBody(request.method)) {
        os << "Content-Length: " << request.body.size() << "\r\n";
    }
    os << "Connection: close\r\n\r\n";
    os << request.body;
    return os.str();
}

void UpstreamHttpClient::Fetch(UpstreamRequest request, ResultCallback cb) {
    request_ = std::move(request);
    callback_ = std::move(cb);
    self_ = shared_from_this();

    std::string error;
    if (!protocol::Url::Parse(request_.url, &url_, &error)) {
        fail(error);
        return;
    }
    if (url_.scheme != "http" && url_.scheme != "https") {
        fail("unsupported URL scheme '" + url_.scheme + "' for an HTTP request");
        return;
    }
    if (url_.secure() && !options_.tlsCtx) {
        fail("TLS is not configured for upstream " + url_.hostHeader());
        return;
    }
    parser_.reset();
    parser_.setRequestMethod(request_.method);

    std::weak_ptr<UpstreamHttpClient> weak(self_);
    timer_.reset(new network::Timer(loop_));
    if (!timer_->Start(options_.timeoutSec, [weak]() {
            if (auto self = weak.lock()) self->onTimeout();
        })) {
        LOG_WARN << "UpstreamHttpClient: request to " << url_.toString() << " runs without a timeout";
    }

    LOG_DEBUG << "UpstreamHttpClient: " << request_.method << ' ' << url_.toString();
    resolver_->Resolve(loop_, url_.host, url_.port,
                       [weak](bool ok, const network::InetAddress& addr, const std::string& err) {
                           if (auto self = weak.lock()) self->onResolved(ok, addr, err);
                       });
}

void UpstreamHttpClient::onResolved(bool ok, const network::InetAddress& addr, const std::string& error) {
    if (finished_) return;
    if (!ok) {
        fail(error);
        return;
    }

    client_ = std::make_shared<network::TcpClient>(loop_, addr, "upstream-http");
    if (url_.secure()) {
        client_->EnableTls(options_.tlsCtx, url_.host, options_.verifyPeer);
    }
    std::weak_ptr<UpstreamHttpClient> weak(shared_from_this());
    client_->SetConnectionCallback([weak](const TcpConnectionPtr& conn) {
        if (auto self = weak.lock()) self->onConnection(conn);
    });
    client_->SetMessageCallback([weak](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
        if (auto self = weak.lock()) self->onMessage(conn, buf);
    });
    client_->SetConnectFailedCallback([weak](const std::string& reason) {
        if (auto self = weak.lock()) self->fail(reason);
    });
    client_->Connect();
}

void UpstreamHttpClient::onConnection(const TcpConnectionPtr& conn) {
    if (finished_) return;
    if (conn->connected()) {
        conn->SetTcpNoDelay(true);
        conn->Send(SerializeRequest(request_, url_));
        return;
    }

    // Peer closed: either the end of a read-until-close body or a failure.
    if (parser_.finishOnClose()) {
        UpstreamResult result;
        result.ok = true;
        result.status = parser_.statusCode();
        result.reason = parser_.reasonPhrase();
        result.headers = parser_.headers();
        result.body = parser_.takeBody();
        finish(std::move(result));
        return;
    }
    std::string why = conn->lastError().empty() ? parser_.error() : conn->lastError();
    fail("upstream " + url_.hostHeader() + " closed the connection: " + why);
}

void UpstreamHttpClient::onMessage(const TcpConnectionPtr& conn, Buffer* buf) {
    (void)conn;
    if (finished_) {
        buf->RetrieveAll();
        return;
    }
    if (!parser_.parseResponse(buf)) {
        fail("malformed response from upstream: " + parser_.error());
        return;
    }
    if (parser_.gotAll()) {
        UpstreamResult result;
        result.ok = true;
        result.status = parser_.statusCode();
        result.reason = parser_.reasonPhrase();
        result.headers = parser_.headers();
        result.body = parser_.takeBody();
        finish(std::move(result));
    }
}

void UpstreamHttpClient::onTimeout() {
    std::ostringstream os;
    os << "upstream request timed out after " << options_.timeoutSec << "s";
    fail(os.str());
}

void UpstreamHttpClient::fail(const std::string& error) {
    UpstreamResult result;
    result.ok = false;
    result.error = error;
    finish(std::move(result));
}

void UpstreamHttpClient::finish(UpstreamResult result) {
    if (finished_) return;
    finished_ = true;
    if (timer_) timer_->Cancel();

    // We may be inside one of the client's callbacks; tear it down from a fresh stack.
    std::shared_ptr<network::TcpClient> client;
    client.swap(client_);
    std::shared_ptr<UpstreamHttpClient> self;
    self.swap(self_);
    ResultCallback cb;
    cb.swap(callback_);
    loop_->QueueInLoop([client, self, cb, result]() mutable {
        client.reset();
        if (cb) cb(std::move(result));
    });
}

} // namespace relay
} // namespace mountproxy
