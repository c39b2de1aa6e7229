#pragma once

#include "mountproxy/relay/MountOptions.h"
#include "mountproxy/relay/UpstreamHttpClient.h"
#include "mountproxy/protocol/HttpResponse.h"
#include "mountproxy/protocol/HttpServer.h"

#include <string>

namespace mountproxy {
namespace network {
class EventLoop;
class Resolver;
} // namespace network

namespace protocol {
class HttpRequest;
} // namespace protocol

namespace relay {

// Forwards one inbound request to the upstream origin and turns the answer
// into the client's response: filtered headers, in-mount redirects, HTML
// rewritten for the mount, or a 502 page when the upstream cannot be reached.
class HttpRelay {
public:
    HttpRelay(const MountOptions& options, network::Resolver* resolver);

    // path is the part after the mount (may be empty). respond runs on loop.
    void Handle(network::EventLoop* loop,
                const protocol::HttpRequest& request,
                const std::string& path,
                const protocol::HttpServer::Responder& respond);

    // Builds the client response for a completed upstream exchange.
    protocol::HttpResponse TranslateResponse(UpstreamResult upstream, const protocol::HttpRequest& request) const;

    // Self-contained 502 page naming the origin, the variable that configures it and the error.
    static protocol::HttpResponse DegradedResponse(const std::string& origin,
                                                   const std::string& originEnv,
                                                   const std::string& error);

private:
    MountOptions options_;
    network::Resolver* resolver_;
};

} // namespace relay
} // namespace mountproxy
