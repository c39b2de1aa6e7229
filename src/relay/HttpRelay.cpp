#include "mountproxy/relay/HttpRelay.h"
#include "mountproxy/relay/HtmlRewriter.h"
#include "mountproxy/relay/UrlTranslator.h"
#include "mountproxy/network/TlsContext.h"
#include "mountproxy/protocol/Compression.h"
#include "mountproxy/protocol/HtmlEscape.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/common/Logger.h"

#include <memory>

namespace mountproxy {
namespace relay {

using protocol::Compression;
using protocol::HeaderSet;
using protocol::HtmlEscape;
using protocol::HttpRequest;
using protocol::HttpResponse;

namespace {

std::string JoinedCookieHeader(const HttpRequest& request) {
    std::string joined;
    for (const std::string& v : request.headers().values("Cookie")) {
        if (!joined.empty()) joined += "; ";
        joined += v;
    }
    return joined;
}

} // namespace

HttpRelay::HttpRelay(const MountOptions& options, network::Resolver* resolver)
    : options_(options),
      resolver_(resolver) {
}

HttpResponse HttpRelay::DegradedResponse(const std::string& origin,
                                         const std::string& originEnv,
                                         const std::string& error) {
    std::string html;
    html += "<!doctype html><html><head><meta charset=\"utf-8\" />";
    html += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\" />";
    html += "<title>Embed unavailable</title></head><body>";
    html += "<h1>Embed unavailable</h1>";
    html += "<p>The Marimo service could not be reached from this server.</p>";
    html += "<p><code>" + HtmlEscape(origin) + "</code></p>";
    html += "<p>For local dev, set <code>" + HtmlEscape(originEnv) + "</code> to a reachable URL.</p>";
    html += "<pre>" + HtmlEscape(error) + "</pre>";
    html += "</body></html>";

    HttpResponse response;
    response.setStatusCode(HttpResponse::k502BadGateway);
    response.setContentType("text/html; charset=utf-8");
    response.setBody(std::move(html));
    return response;
}

HttpResponse HttpRelay::TranslateResponse(UpstreamResult upstream, const HttpRequest& request) const {
    HeaderSet headers = FilterResponseHeaders(upstream.headers);

    if (auto location = upstream.headers.get("Location")) {
        if (!location->empty()) headers.set("Location", RewriteLocation(*location, options_.mount));
    }

    std::string body = std::move(upstream.body);
    bool decoded = true;
    const std::string contentEncoding = upstream.headers.value("Content-Encoding");
    const Compression::Encoding enc = Compression::ParseContentEncoding(contentEncoding);
    if (enc == Compression::Encoding::kGzip || enc == Compression::Encoding::kDeflate) {
        std::string plain;
        if (Compression::Decompress(enc, body, &plain)) {
            body.swap(plain);
        } else {
            LOG_WARN << "HttpRelay: cannot decode " << contentEncoding << " body, relaying it encoded";
            decoded = false;
        }
    } else if (enc == Compression::Encoding::kUnknown) {
        decoded = false;
    }
    if (!decoded) {
        // The bytes are still encoded, so the client must be told how.
        headers.add("Content-Encoding", contentEncoding);
    }

    const std::string contentType = HeaderSet::ToLower(upstream.headers.value("Content-Type"));
    if (decoded && contentType.find("text/html") != std::string::npos) {
        const std::optional<std::string> theme =
            ThemeFromCookieHeader(JoinedCookieHeader(request), options_.themeCookie);
        body = RewriteHtml(body, options_.mount, theme);
        if (theme) {
            AppendVary(&headers, "Cookie");
        }
    }

    HttpResponse response;
    response.setStatusCode(upstream.status);
    response.setStatusMessage(upstream.reason);
    response.headers().swap(headers);
    response.setBody(std::move(body));
    return response;
}

void HttpRelay::Handle(network::EventLoop* loop,
                       const HttpRequest& request,
                       const std::string& path,
                       const protocol::HttpServer::Responder& respond) {
    const std::string origin = options_.origin ? options_.origin() : std::string(kDefaultOrigin);

    UpstreamRequest upstream;
    upstream.method = request.method();
    upstream.url = BuildUpstreamUrl(origin, path, request.query());
    upstream.headers = ForwardRequestHeaders(request.headers());
    upstream.body = request.body();

    UpstreamHttpClient::Options clientOptions;
    clientOptions.timeoutSec = options_.upstreamTimeoutSec;
    clientOptions.tlsCtx = options_.upstreamTls ? options_.upstreamTls->ctx() : nullptr;
    clientOptions.verifyPeer = options_.verifyPeer;

    auto client = std::make_shared<UpstreamHttpClient>(loop, resolver_, clientOptions);
    // The request is copied: the inbound parser reuses its storage once this returns.
    auto inbound = std::make_shared<HttpRequest>(request);
    const std::string url = upstream.url;
    const std::string originEnv = options_.originEnv;
    client->Fetch(std::move(upstream), [this, inbound, respond, origin, originEnv, url](UpstreamResult result) {
        if (!result.ok) {
            LOG_WARN << "HttpRelay: " << inbound->method() << ' ' << url << " failed: " << result.error;
            respond(DegradedResponse(origin, originEnv, result.error));
            return;
        }
        LOG_DEBUG << "HttpRelay: " << inbound->method() << ' ' << url << " -> " << result.status;
        respond(TranslateResponse(std::move(result), *inbound));
    });
}

} // namespace relay
} // namespace mountproxy
