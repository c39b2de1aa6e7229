#pragma once

#include "mountproxy/protocol/HeaderSet.h"

#include <string>

namespace mountproxy {
namespace relay {

// Mapping between the proxy's view of a request and the upstream's. None of
// these fail: input they do not understand passes through unchanged.

// origin with trailing '/' trimmed + "/" + path with leading '/' trimmed,
// then "?query" when query is non-empty. Percent-encoding is left alone.
std::string BuildUpstreamUrl(const std::string& origin, const std::string& path, const std::string& query);

// connection, keep-alive, proxy-authenticate, proxy-authorization, te,
// trailers, transfer-encoding, upgrade.
bool IsHopByHopHeader(const std::string& name);

// Request headers for the upstream: hop-by-hop, Host and Content-Length removed.
protocol::HeaderSet ForwardRequestHeaders(const protocol::HeaderSet& headers);

// Response headers for the client: hop-by-hop, Content-Length, Content-Encoding,
// X-Frame-Options and Content-Security-Policy removed. The result always
// carries X-Robots-Tag: noindex, next to any directive the upstream sent.
protocol::HeaderSet FilterResponseHeaders(const protocol::HeaderSet& headers);

// Keeps a root-relative redirect inside the mount.
std::string RewriteLocation(const std::string& location, const std::string& mount);

// Adds value to Vary unless it is already listed (case-insensitive).
void AppendVary(protocol::HeaderSet* headers, const std::string& value);

// https:// -> wss://, http:// -> ws://, anything else unchanged.
std::string ToWebSocketOrigin(const std::string& origin);

} // namespace relay
} // namespace mountproxy
