#pragma once

#include <cstdint>
#include <string>

namespace mountproxy {
namespace protocol {

// Absolute http(s)/ws(s) URL split into the parts a client connection needs.
struct Url {
    std::string scheme;   // lower case
    std::string host;
    uint16_t port{0};
    std::string target;   // path + optional "?query", never empty

    bool secure() const { return scheme == "https" || scheme == "wss"; }
    bool defaultPort() const { return port == DefaultPort(scheme); }
    // Host header value: host, plus ":port" when it differs from the scheme default.
    std::string hostHeader() const;
    std::string toString() const;

    static uint16_t DefaultPort(const std::string& scheme);

    // Returns false with a reason for relative URLs, unknown schemes,
    // user info, IPv6 literals and bad ports.
    static bool Parse(const std::string& url, Url* out, std::string* error);
};

} // namespace protocol
} // namespace mountproxy
