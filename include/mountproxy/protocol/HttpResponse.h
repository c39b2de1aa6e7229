#pragma once

#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/network/Buffer.h"

#include <string>
#include <utility>

namespace mountproxy {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k101SwitchingProtocols = 101,
        k200Ok = 200,
        k204NoContent = 204,
        k301MovedPermanently = 301,
        k304NotModified = 304,
        k307TemporaryRedirect = 307,
        k400BadRequest = 400,
        k404NotFound = 404,
        k500InternalServerError = 500,
        k502BadGateway = 502,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), closeConnection_(close), headRequest_(false) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { headers_.set("Content-Type", contentType); }

    // Responses to HEAD announce the length of the body held here but send no
    // body bytes. A relayed HEAD holds an empty body, so it announces 0.
    void setHeadRequest(bool on) { headRequest_ = on; }

    void addHeader(const std::string& key, const std::string& value) { headers_.add(key, value); }
    const HeaderSet& headers() const { return headers_; }
    HeaderSet& headers() { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void setBody(std::string&& body) { body_ = std::move(body); }
    const std::string& body() const { return body_; }

    // Serializes status line, headers and body. Content-Length and Connection
    // are always computed here; any caller supplied copies are ignored.
    void appendToBuffer(mountproxy::network::Buffer* output) const;

    // Standard reason phrase, "Unknown" when not known.
    static const char* ReasonPhrase(int code);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool headRequest_;
    HeaderSet headers_;
    std::string body_;
};

} // namespace protocol
} // namespace mountproxy
