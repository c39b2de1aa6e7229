#pragma once

#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/network/Buffer.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace mountproxy {
namespace protocol {

// Incremental HTTP/1.x request parser. Feed it the connection's input
// buffer as bytes arrive; it consumes exactly one request at a time.
class HttpContext {
public:
    // Request line plus headers.
    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    HttpContext() { reset(); }

    // False on a malformed or oversized request; the connection should get a 400.
    bool parseRequest(mountproxy::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return stage_ == Stage::kDone; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    enum class Stage { kRequestLine, kHeaders, kBody, kChunkSize, kChunkData, kTrailers, kDone };

    bool parseRequestLine(const std::string& line);
    bool parseHeaderLine(const std::string& line);
    bool beginBody();
    bool readLine(mountproxy::network::Buffer* buf, std::string* line, bool* ok);
    // False on a protocol error; *progress tells whether input was consumed.
    bool step(mountproxy::network::Buffer* buf, bool* progress);

    Stage stage_;
    HttpRequest request_;
    size_t headBytes_;
    size_t remaining_;
};

} // namespace protocol
} // namespace mountproxy
