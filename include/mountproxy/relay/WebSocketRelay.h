#pragma once

#include "mountproxy/relay/MountOptions.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/protocol/HeaderSet.h"

#include <string>
#include <vector>

namespace mountproxy {
namespace network {
class Resolver;
} // namespace network

namespace protocol {
class HttpRequest;
} // namespace protocol

namespace relay {

// Pairs an inbound WebSocket with one upstream WebSocket and pumps messages
// both ways until either side closes. The inbound handshake is answered only
// once the upstream one has completed, echoing its subprotocol.
class WebSocketRelay {
public:
    enum class State { kPending, kConnecting, kBridging, kClosed };

    WebSocketRelay(const MountOptions& options, network::Resolver* resolver);

    // Takes over an upgraded inbound connection. path is the part after the mount.
    void Handle(const network::TcpConnectionPtr& conn,
                const protocol::HttpRequest& request,
                const std::string& path);

    // Comma separated offer, trimmed, empty items dropped.
    static std::vector<std::string> ParseSubprotocols(const std::string& header);

    // Only Cookie and Authorization reach the upstream handshake.
    static protocol::HeaderSet UpstreamHandshakeHeaders(const protocol::HeaderSet& inbound);

    // 101 response completing the inbound handshake.
    static std::string AcceptResponse(const std::string& clientKey, const std::string& subprotocol);

    static const char* StateName(State state);

private:
    class Session;

    MountOptions options_;
    network::Resolver* resolver_;
};

} // namespace relay
} // namespace mountproxy
