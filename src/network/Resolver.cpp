#include "mountproxy/network/Resolver.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/EventLoopThread.h"
#include "mountproxy/common/Logger.h"

#include <netdb.h>
#include <sys/socket.h>
#include <cstring>

namespace mountproxy {
namespace network {

Resolver::Resolver()
    : loop_(nullptr) {
}

Resolver::~Resolver() = default;

EventLoop* Resolver::WorkerLoop() {
    if (!loop_) {
        thread_ = std::make_unique<EventLoopThread>("resolver");
        loop_ = thread_->StartLoop();
    }
    return loop_;
}

bool Resolver::ResolveBlocking(const std::string& host, uint16_t port, InetAddress* out, std::string* error) {
    if (InetAddress::FromIpLiteral(host, port, out)) return true;

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0 || !res) {
        if (error) *error = "resolve " + host + ": " + (gai != 0 ? ::gai_strerror(gai) : "no address");
        if (res) ::freeaddrinfo(res);
        return false;
    }
    struct sockaddr_in addr;
    std::memcpy(&addr, res->ai_addr, sizeof addr);
    ::freeaddrinfo(res);
    out->setSockAddr(addr);
    return true;
}

void Resolver::Resolve(EventLoop* replyLoop, const std::string& host, uint16_t port, ResolveCallback cb) {
    InetAddress literal;
    if (InetAddress::FromIpLiteral(host, port, &literal)) {
        replyLoop->QueueInLoop([cb = std::move(cb), literal]() { cb(true, literal, std::string()); });
        return;
    }

    // The worker loop is created on first use from whichever thread asks first.
    EventLoop* worker = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = WorkerLoop();
    }

    worker->QueueInLoop([replyLoop, host, port, cb = std::move(cb)]() mutable {
        InetAddress addr;
        std::string error;
        const bool ok = ResolveBlocking(host, port, &addr, &error);
        LOG_DEBUG << "Resolver: " << host << " -> " << (ok ? addr.toIp() : error);
        replyLoop->QueueInLoop([cb = std::move(cb), ok, addr, error]() { cb(ok, addr, error); });
    });
}

} // namespace network
} // namespace mountproxy
