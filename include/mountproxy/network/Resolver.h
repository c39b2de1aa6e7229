#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/InetAddress.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace mountproxy {
namespace network {

class EventLoop;
class EventLoopThread;

// Host name lookup off the I/O loops. getaddrinfo() blocks, so it runs on a
// dedicated loop thread and the answer is posted back to the caller's loop.
class Resolver : mountproxy::common::noncopyable {
public:
    // ok=false carries the gai error text in error.
    using ResolveCallback = std::function<void(bool ok, const InetAddress& addr, const std::string& error)>;

    Resolver();
    ~Resolver();

    // cb always runs on replyLoop, never inline.
    void Resolve(EventLoop* replyLoop, const std::string& host, uint16_t port, ResolveCallback cb);

    // Synchronous lookup, used by the worker and by callers that may block.
    static bool ResolveBlocking(const std::string& host, uint16_t port, InetAddress* out, std::string* error);

private:
    EventLoop* WorkerLoop();

    std::unique_ptr<EventLoopThread> thread_;
    EventLoop* loop_;
    std::mutex mutex_;
};

} // namespace network
} // namespace mountproxy
