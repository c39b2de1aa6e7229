#include "mountproxy/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace mountproxy {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int code) {
    switch (code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

void HttpResponse::appendToBuffer(mountproxy::network::Buffer* output) const {
    char buf[64];
    snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(ReasonPhrase(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    for (const auto& header : headers_) {
        if (HeaderSet::IEquals(header.first, "Content-Length") ||
            HeaderSet::IEquals(header.first, "Connection")) {
            continue;
        }
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    const bool bodyless = statusCode_ == k204NoContent || statusCode_ == k304NotModified ||
                          (statusCode_ >= 100 && statusCode_ < 200);
    if (!bodyless) {
        snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
        output->Append(buf, strlen(buf));
    }
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");
    output->Append("\r\n");
    if (!bodyless && !headRequest_) {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace mountproxy
