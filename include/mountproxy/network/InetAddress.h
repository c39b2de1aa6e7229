#pragma once

#include <netinet/in.h>

#include <string>

namespace mountproxy {
namespace network {

// IPv4 socket address, held in network byte order.
class InetAddress {
public:
    // Wildcard address, or 127.0.0.1 when loopbackOnly.
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    explicit InetAddress(const struct sockaddr_in& addr) : addr_(addr) {}

    // Parses a dotted-quad. Host names are left to the Resolver.
    static bool FromIpLiteral(const std::string& ip, uint16_t port, InetAddress* out);

    std::string toIp() const;
    std::string toIpPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace mountproxy
