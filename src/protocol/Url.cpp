#include "mountproxy/protocol/Url.h"
#include "mountproxy/protocol/HeaderSet.h"

#include <cctype>
#include <cstdlib>

namespace mountproxy {
namespace protocol {

uint16_t Url::DefaultPort(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    return 0;
}

std::string Url::hostHeader() const {
    if (defaultPort()) return host;
    return host + ":" + std::to_string(port);
}

std::string Url::toString() const {
    return scheme + "://" + hostHeader() + target;
}

bool Url::Parse(const std::string& url, Url* out, std::string* error) {
    auto failWith = [error](const std::string& why) {
        if (error) *error = why;
        return false;
    };

    const size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return failWith("not an absolute URL: " + url);
    }
    Url u;
    u.scheme = HeaderSet::ToLower(url.substr(0, sep));
    if (DefaultPort(u.scheme) == 0) {
        return failWith("unsupported URL scheme '" + u.scheme + "'");
    }

    const size_t authStart = sep + 3;
    size_t authEnd = url.find_first_of("/?#", authStart);
    if (authEnd == std::string::npos) authEnd = url.size();
    const std::string authority = url.substr(authStart, authEnd - authStart);
    if (authority.empty()) {
        return failWith("URL has no host: " + url);
    }
    if (authority.find('@') != std::string::npos) {
        return failWith("user info in URL is not supported");
    }
    if (authority[0] == '[') {
        return failWith("IPv6 literal hosts are not supported");
    }

    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        u.host = authority.substr(0, colon);
        const std::string portStr = authority.substr(colon + 1);
        if (portStr.empty()) {
            u.port = DefaultPort(u.scheme);
        } else {
            for (char c : portStr) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return failWith("invalid port '" + portStr + "'");
                }
            }
            const long p = std::strtol(portStr.c_str(), nullptr, 10);
            if (portStr.size() > 5 || p <= 0 || p > 65535) {
                return failWith("invalid port '" + portStr + "'");
            }
            u.port = static_cast<uint16_t>(p);
        }
    } else {
        u.host = authority;
        u.port = DefaultPort(u.scheme);
    }
    if (u.host.empty()) {
        return failWith("URL has no host: " + url);
    }

    // Fragments never go on the wire.
    std::string rest = url.substr(authEnd);
    const size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);
    if (rest.empty() || rest[0] == '?') rest.insert(0, "/");
    u.target = rest;

    *out = u;
    return true;
}

} // namespace protocol
} // namespace mountproxy
