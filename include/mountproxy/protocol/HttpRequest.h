#pragma once

#include "mountproxy/protocol/HeaderSet.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace mountproxy {
namespace protocol {

// An inbound HTTP/1.x request as parsed off the wire. The path is kept raw
// (still percent-encoded) and the query excludes its '?'.
class HttpRequest {
public:
    enum Version { kUnknown, kHttp10, kHttp11 };

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    void setMethod(std::string method) { method_ = std::move(method); }
    const std::string& method() const { return method_; }

    void setPath(std::string path) { path_ = std::move(path); }
    const std::string& path() const { return path_; }

    void setQuery(std::string query) { query_ = std::move(query); }
    const std::string& query() const { return query_; }

    // When the first byte of the request was read.
    void setReceiveTime(std::chrono::system_clock::time_point t) { receiveTime_ = t; }
    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

    std::string getHeader(const std::string& field) const { return headers_.value(field); }
    bool hasHeader(const std::string& field) const { return headers_.has(field); }
    const HeaderSet& headers() const { return headers_; }
    HeaderSet& headers() { return headers_; }

    void setBody(std::string body) { body_ = std::move(body); }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(version_, that.version_);
        method_.swap(that.method_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        std::swap(receiveTime_, that.receiveTime_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    Version version_;
    std::string method_;
    std::string path_;
    std::string query_;
    std::chrono::system_clock::time_point receiveTime_;
    HeaderSet headers_;
    std::string body_;
};

} // namespace protocol
} // namespace mountproxy
