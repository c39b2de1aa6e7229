#pragma once

#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/network/Buffer.h"

#include <cstddef>
#include <string>

namespace mountproxy {
namespace protocol {

// Incremental HTTP/1.x response parser for the upstream side of the relay.
// - Supports Content-Length, Transfer-Encoding: chunked and read-until-close bodies.
// - Interim 1xx responses are skipped, except 101 which completes without a body.
// - The decoded body (chunk framing removed) is collected in body().
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kExpectBody, kGotAll, kError };

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    // HEAD responses never carry a body, whatever the framing headers say.
    void setRequestMethod(const std::string& method);

    // Consumes as much of buf as belongs to this response.
    // Returns false on a protocol error (see error()).
    bool parseResponse(mountproxy::network::Buffer* buf);

    // The peer closed the connection. Completes a read-until-close body;
    // returns false when the response was cut short.
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    ParseState state() const { return state_; }

    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reasonPhrase() const { return reason_; }
    const HeaderSet& headers() const { return headers_; }
    const std::string& body() const { return body_; }
    std::string takeBody() { std::string b; b.swap(body_); return b; }
    const std::string& error() const { return error_; }
    bool keepAlive() const { return keepAlive_; }

private:
    bool fail(const std::string& why);
    bool processStatusLine(const char* begin, const char* end);
    bool processHeadersDone();
    bool consumeChunked(mountproxy::network::Buffer* buf);

    ParseState state_{kExpectStatusLine};
    bool headRequest_{false};

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;
    HeaderSet headers_;
    std::string body_;
    std::string error_;
    size_t headerBytes_{0};

    bool chunked_{false};
    bool readUntilClose_{false};
    size_t bodyRemaining_{0};
    bool keepAlive_{false};

    bool expectingChunkSize_{true};
    bool inTrailer_{false};
    size_t chunkRemaining_{0};
};

} // namespace protocol
} // namespace mountproxy
