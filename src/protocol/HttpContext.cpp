#include "mountproxy/protocol/HttpContext.h"
#include "mountproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace mountproxy {
namespace protocol {

using mountproxy::network::Buffer;

namespace {

// RFC 7230 tchar.
bool IsToken(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isalnum(c) && (c == 0 || !std::strchr("!#$%&'*+-.^_`|~", c))) {
            return false;
        }
    }
    return true;
}

bool ParseSize(const std::string& text, int base, size_t* out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') return false;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, base);
    if (*end != '\0') return false;
    *out = static_cast<size_t>(v);
    return true;
}

} // namespace

void HttpContext::reset() {
    stage_ = Stage::kRequestLine;
    HttpRequest fresh;
    request_.swap(fresh);
    headBytes_ = 0;
    remaining_ = 0;
}

bool HttpContext::parseRequestLine(const std::string& line) {
    // METHOD SP target SP HTTP/1.x
    const size_t sp1 = line.find(' ');
    const size_t sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) {
        return false;
    }
    const std::string method = line.substr(0, sp1);
    const std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    const std::string version = line.substr(sp2 + 1);
    if (!IsToken(method)) {
        return false;
    }
    if (version == "HTTP/1.1") {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (version == "HTTP/1.0") {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    request_.setMethod(method);
    const size_t q = target.find('?');
    request_.setPath(target.substr(0, q));
    if (q != std::string::npos) {
        request_.setQuery(target.substr(q + 1));
    }
    return true;
}

bool HttpContext::parseHeaderLine(const std::string& line) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    const std::string name = line.substr(0, colon);
    // No whitespace between the field name and the colon.
    if (std::isspace(static_cast<unsigned char>(name.back()))) {
        return false;
    }
    request_.headers().add(name, HeaderSet::Trim(line.substr(colon + 1)));
    return true;
}

bool HttpContext::beginBody() {
    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty()) {
        if (!HeaderSet::ContainsToken(te, "chunked")) {
            return false;
        }
        stage_ = Stage::kChunkSize;
        return true;
    }
    const std::string cl = request_.getHeader("Content-Length");
    remaining_ = 0;
    if (!cl.empty() && !ParseSize(HeaderSet::Trim(cl), 10, &remaining_)) {
        return false;
    }
    stage_ = remaining_ > 0 ? Stage::kBody : Stage::kDone;
    return true;
}

// True with *line set when a full CRLF line was taken off buf.
bool HttpContext::readLine(Buffer* buf, std::string* line, bool* ok) {
    const bool inHead = stage_ == Stage::kRequestLine || stage_ == Stage::kHeaders;
    const char* crlf = buf->FindCRLF();
    if (!crlf) {
        if (inHead && headBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
            LOG_WARN << "HttpContext: request head over " << kMaxHeaderBytes << " bytes";
            *ok = false;
        }
        return false;
    }
    if (inHead) {
        headBytes_ += static_cast<size_t>(crlf - buf->Peek()) + 2;
        if (headBytes_ > kMaxHeaderBytes) {
            *ok = false;
            return false;
        }
    }
    line->assign(buf->Peek(), crlf);
    buf->RetrieveUntil(crlf + 2);
    return true;
}

bool HttpContext::step(Buffer* buf, bool* progress) {
    *progress = false;
    bool ok = true;
    std::string line;

    switch (stage_) {
        case Stage::kRequestLine:
            if (!readLine(buf, &line, &ok)) return ok;
            *progress = true;
            if (!parseRequestLine(line)) return false;
            stage_ = Stage::kHeaders;
            return true;

        case Stage::kHeaders:
            if (!readLine(buf, &line, &ok)) return ok;
            *progress = true;
            if (line.empty()) return beginBody();
            return parseHeaderLine(line);

        case Stage::kBody: {
            const size_t n = std::min(remaining_, buf->ReadableBytes());
            if (n == 0) return true;
            request_.appendBody(buf->Peek(), n);
            buf->Retrieve(n);
            remaining_ -= n;
            if (remaining_ == 0) stage_ = Stage::kDone;
            *progress = true;
            return true;
        }

        case Stage::kChunkSize: {
            if (!readLine(buf, &line, &ok)) return ok;
            *progress = true;
            // Extensions after ';' are ignored.
            const std::string size = HeaderSet::Trim(line.substr(0, line.find(';')));
            if (!ParseSize(size, 16, &remaining_)) return false;
            stage_ = remaining_ == 0 ? Stage::kTrailers : Stage::kChunkData;
            return true;
        }

        case Stage::kChunkData: {
            if (buf->ReadableBytes() < remaining_ + 2) return true;
            const char* data = buf->Peek();
            if (data[remaining_] != '\r' || data[remaining_ + 1] != '\n') return false;
            request_.appendBody(data, remaining_);
            buf->Retrieve(remaining_ + 2);
            remaining_ = 0;
            stage_ = Stage::kChunkSize;
            *progress = true;
            return true;
        }

        case Stage::kTrailers:
            // Trailer fields are dropped.
            if (!readLine(buf, &line, &ok)) return ok;
            *progress = true;
            if (line.empty()) stage_ = Stage::kDone;
            return true;

        case Stage::kDone:
            return true;
    }
    return true;
}

bool HttpContext::parseRequest(Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    if (stage_ == Stage::kRequestLine && headBytes_ == 0) {
        request_.setReceiveTime(receiveTime);
    }
    bool progress = true;
    while (progress && stage_ != Stage::kDone) {
        if (!step(buf, &progress)) {
            return false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace mountproxy
