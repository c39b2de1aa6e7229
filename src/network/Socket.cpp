#include "mountproxy/network/Socket.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/common/Logger.h"

#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

namespace {

typedef int (*NameQuery)(int, struct sockaddr*, socklen_t*);

InetAddress QueryName(NameQuery query, const char* what, int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (query(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_ERROR << "Socket: " << what << " fd=" << sockfd << " failed: " << std::strerror(errno);
    }
    return InetAddress(addr);
}

} // namespace

Socket::~Socket() {
    ::close(sockfd_);
}

int Socket::CreateNonblocking() {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        LOG_ERROR << "Socket: socket() failed: " << std::strerror(errno);
    }
    return fd;
}

bool Socket::BindAddress(const InetAddress& addr) {
    if (::bind(sockfd_, addr.getSockAddr(), sizeof(struct sockaddr_in)) == 0) {
        return true;
    }
    LOG_ERROR << "Socket: bind " << addr.toIpPort() << " failed: " << std::strerror(errno);
    return false;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) == 0) {
        return true;
    }
    LOG_ERROR << "Socket: listen fd=" << sockfd_ << " failed: " << std::strerror(errno);
    return false;
}

int Socket::Accept(InetAddress* peer) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    const int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                                 SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peer->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    // ENOTCONN once the peer reset is expected.
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_DEBUG << "Socket: shutdown fd=" << sockfd_ << ": " << std::strerror(errno);
    }
}

void Socket::setOption(Option opt, bool on) {
    int level = SOL_SOCKET;
    int name = SO_KEEPALIVE;
    switch (opt) {
        case kNoDelay:   level = IPPROTO_TCP; name = TCP_NODELAY; break;
        case kReuseAddr: name = SO_REUSEADDR; break;
        case kReusePort: name = SO_REUSEPORT; break;
        case kKeepAlive: name = SO_KEEPALIVE; break;
    }
    const int value = on ? 1 : 0;
    if (::setsockopt(sockfd_, level, name, &value, sizeof value) < 0) {
        LOG_WARN << "Socket: setsockopt(" << name << ") fd=" << sockfd_ << " failed: " << std::strerror(errno);
    }
}

InetAddress Socket::LocalAddress(int sockfd) {
    return QueryName(::getsockname, "getsockname", sockfd);
}

InetAddress Socket::PeerAddress(int sockfd) {
    return QueryName(::getpeername, "getpeername", sockfd);
}

int Socket::SocketError(int sockfd) {
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return errno;
    }
    return err;
}

} // namespace network
} // namespace mountproxy
