#include "mountproxy/network/Acceptor.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/common/Logger.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reusePort)
    : socket_(Socket::CreateNonblocking()),
      channel_(loop, socket_.fd()),
      bound_(false),
      listening_(false) {
    if (socket_.fd() < 0) {
        return;
    }
    socket_.SetReuseAddr(true);
    if (reusePort) {
        socket_.SetReusePort(true);
    }
    bound_ = socket_.BindAddress(listenAddr);
    channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { acceptReady(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        channel_.DisableAll();
        channel_.Remove();
    }
}

void Acceptor::Listen() {
    if (!bound_ || listening_) {
        return;
    }
    listening_ = socket_.Listen();
    if (listening_) {
        channel_.EnableReading();
    }
}

InetAddress Acceptor::ListenAddress() const {
    return Socket::LocalAddress(socket_.fd());
}

void Acceptor::acceptReady() {
    // Drain the backlog; level-triggered epoll would report it again anyway.
    for (;;) {
        InetAddress peer;
        const int connfd = socket_.Accept(&peer);
        if (connfd < 0) {
            const int err = errno;
            if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR && err != ECONNABORTED) {
                LOG_ERROR << "Acceptor: accept failed: " << std::strerror(err);
            }
            return;
        }
        if (!onAccept_) {
            ::close(connfd);
            continue;
        }
        onAccept_(connfd, peer);
    }
}

} // namespace network
} // namespace mountproxy
