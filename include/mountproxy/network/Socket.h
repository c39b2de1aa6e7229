#pragma once

#include "mountproxy/common/noncopyable.h"

namespace mountproxy {
namespace network {

class InetAddress;

// Owning wrapper for a TCP socket fd; the fd is closed with the object.
class Socket : mountproxy::common::noncopyable {
public:
    explicit Socket(int sockfd) : sockfd_(sockfd) {}
    ~Socket();

    // Non-blocking, close-on-exec IPv4 stream socket. Returns -1 on failure.
    static int CreateNonblocking();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& addr);
    bool Listen();
    // Accepted fd is non-blocking; -1 with errno set when nothing was pending.
    int Accept(InetAddress* peer);
    void ShutdownWrite();

    void SetTcpNoDelay(bool on) { setOption(kNoDelay, on); }
    void SetReuseAddr(bool on) { setOption(kReuseAddr, on); }
    void SetReusePort(bool on) { setOption(kReusePort, on); }
    void SetKeepAlive(bool on) { setOption(kKeepAlive, on); }

    static InetAddress LocalAddress(int sockfd);
    static InetAddress PeerAddress(int sockfd);
    // Pending SO_ERROR, 0 when none.
    static int SocketError(int sockfd);

private:
    enum Option { kNoDelay, kReuseAddr, kReusePort, kKeepAlive };
    void setOption(Option opt, bool on);

    const int sockfd_;
};

} // namespace network
} // namespace mountproxy
