#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Channel.h"
#include "mountproxy/network/Socket.h"

#include <functional>

namespace mountproxy {
namespace network {

class EventLoop;
class InetAddress;

// Listening socket on the base loop. Each accepted fd is handed to the
// callback, which takes ownership of it.
class Acceptor : mountproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress& peer)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reusePort);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { onAccept_ = std::move(cb); }

    // False when bind() failed in the constructor.
    bool Bound() const { return bound_; }
    bool Listening() const { return listening_; }
    void Listen();

    InetAddress ListenAddress() const;

private:
    void acceptReady();

    Socket socket_;
    Channel channel_;
    NewConnectionCallback onAccept_;
    bool bound_;
    bool listening_;
};

} // namespace network
} // namespace mountproxy
