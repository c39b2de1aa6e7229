#include "mountproxy/network/InetAddress.h"

#include <arpa/inet.h>

#include <cstring>

namespace mountproxy {
namespace network {

namespace {

struct sockaddr_in MakeAddr(uint32_t hostOrderIp, uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(hostOrderIp);
    addr.sin_port = htons(port);
    return addr;
}

} // namespace

InetAddress::InetAddress(uint16_t port, bool loopbackOnly)
    : addr_(MakeAddr(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY, port)) {
}

bool InetAddress::FromIpLiteral(const std::string& ip, uint16_t port, InetAddress* out) {
    struct sockaddr_in addr = MakeAddr(INADDR_ANY, port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }
    out->setSockAddr(addr);
    return true;
}

std::string InetAddress::toIp() const {
    char text[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, text, sizeof text);
    return text;
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(ntohs(addr_.sin_port));
}

} // namespace network
} // namespace mountproxy
