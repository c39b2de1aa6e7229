#include "mountproxy/relay/UrlTranslator.h"

namespace mountproxy {
namespace relay {

using protocol::HeaderSet;

namespace {

const char* const kHopByHopHeaders[] = {
    "connection",
    "keep-alive",
    "proxy-authenticate",
    "proxy-authorization",
    "te",
    "trailers",
    "transfer-encoding",
    "upgrade",
};

// Invalidated by body rewriting or incompatible with embedding.
const char* const kResponseOnlyDrops[] = {
    "content-length",
    "content-encoding",
    "x-frame-options",
    "content-security-policy",
};

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string ReplaceScheme(const std::string& origin, size_t schemeLen, const char* scheme) {
    size_t i = schemeLen;
    while (i < origin.size() && origin[i] == '/') ++i;
    return scheme + origin.substr(i);
}

} // namespace

std::string BuildUpstreamUrl(const std::string& origin, const std::string& path, const std::string& query) {
    size_t end = origin.size();
    while (end > 0 && origin[end - 1] == '/') --end;
    size_t start = 0;
    while (start < path.size() && path[start] == '/') ++start;

    std::string url = origin.substr(0, end);
    url += '/';
    url.append(path, start, std::string::npos);
    if (!query.empty()) {
        url += '?';
        url += query;
    }
    return url;
}

bool IsHopByHopHeader(const std::string& name) {
    for (const char* h : kHopByHopHeaders) {
        if (HeaderSet::IEquals(name, h)) return true;
    }
    return false;
}

HeaderSet ForwardRequestHeaders(const HeaderSet& headers) {
    HeaderSet out;
    for (const auto& h : headers) {
        if (IsHopByHopHeader(h.first) ||
            HeaderSet::IEquals(h.first, "host") ||
            HeaderSet::IEquals(h.first, "content-length")) {
            continue;
        }
        out.add(h.first, h.second);
    }
    return out;
}

HeaderSet FilterResponseHeaders(const HeaderSet& headers) {
    HeaderSet out;
    for (const auto& h : headers) {
        if (IsHopByHopHeader(h.first)) continue;
        bool drop = false;
        for (const char* d : kResponseOnlyDrops) {
            if (HeaderSet::IEquals(h.first, d)) {
                drop = true;
                break;
            }
        }
        if (!drop) out.add(h.first, h.second);
    }
    bool noindex = false;
    for (const auto& v : out.values("X-Robots-Tag")) {
        if (HeaderSet::ContainsToken(v, "noindex")) noindex = true;
    }
    if (!noindex) out.add("X-Robots-Tag", "noindex");
    return out;
}

std::string RewriteLocation(const std::string& location, const std::string& mount) {
    if (!StartsWith(location, "/")) return location;
    if (StartsWith(location, mount)) return location;
    return mount + location;
}

void AppendVary(HeaderSet* headers, const std::string& value) {
    const size_t idx = headers->find("Vary");
    if (idx == HeaderSet::npos) {
        headers->add("Vary", value);
        return;
    }
    std::string& existing = headers->at(idx).second;
    if (HeaderSet::ContainsToken(existing, value)) return;
    existing += ", " + value;
}

std::string ToWebSocketOrigin(const std::string& origin) {
    if (StartsWith(origin, "https://")) return ReplaceScheme(origin, 8, "wss://");
    if (StartsWith(origin, "http://")) return ReplaceScheme(origin, 7, "ws://");
    return origin;
}

} // namespace relay
} // namespace mountproxy
