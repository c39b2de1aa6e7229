#include "mountproxy/protocol/HttpResponseContext.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mountproxy {
namespace protocol {

using mountproxy::network::Buffer;

void HttpResponseContext::setRequestMethod(const std::string& method) {
    headRequest_ = HeaderSet::IEquals(method, "HEAD");
}

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    headRequest_ = false;
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    body_.clear();
    error_.clear();
    headerBytes_ = 0;
    chunked_ = false;
    readUntilClose_ = false;
    bodyRemaining_ = 0;
    keepAlive_ = false;
    expectingChunkSize_ = true;
    inTrailer_ = false;
    chunkRemaining_ = 0;
}

bool HttpResponseContext::fail(const std::string& why) {
    state_ = kError;
    error_ = why;
    return false;
}

bool HttpResponseContext::processStatusLine(const char* begin, const char* end) {
    // HTTP/1.1 200 OK
    const std::string line(begin, end);
    if (line.compare(0, 5, "HTTP/") != 0) {
        return fail("malformed status line");
    }
    const size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) {
        return fail("malformed status line");
    }
    const std::string ver = line.substr(5, sp1 - 5);
    const size_t dot = ver.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= ver.size()) {
        return fail("malformed HTTP version");
    }
    httpMajor_ = std::atoi(ver.substr(0, dot).c_str());
    httpMinor_ = std::atoi(ver.substr(dot + 1).c_str());

    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) sp2 = line.size();
    const std::string code = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(), ::isdigit)) {
        return fail("malformed status code");
    }
    statusCode_ = std::atoi(code.c_str());
    reason_ = sp2 < line.size() ? line.substr(sp2 + 1) : std::string();
    headers_.clear();
    return true;
}

bool HttpResponseContext::processHeadersDone() {
    if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
        // Interim response; the real one follows on the same connection.
        state_ = kExpectStatusLine;
        headers_.clear();
        headerBytes_ = 0;
        return true;
    }

    const std::string conn = headers_.value("Connection");
    if (httpMajor_ == 1 && httpMinor_ == 0) {
        keepAlive_ = HeaderSet::ContainsToken(conn, "keep-alive");
    } else {
        keepAlive_ = !HeaderSet::ContainsToken(conn, "close");
    }

    const bool noBody = headRequest_ || statusCode_ == 101 || statusCode_ == 204 || statusCode_ == 304;
    if (noBody) {
        state_ = kGotAll;
        return true;
    }

    chunked_ = false;
    readUntilClose_ = false;
    bodyRemaining_ = 0;
    const std::string te = headers_.value("Transfer-Encoding");
    if (!te.empty() && HeaderSet::ContainsToken(te, "chunked")) {
        chunked_ = true;
        expectingChunkSize_ = true;
        inTrailer_ = false;
        chunkRemaining_ = 0;
    } else if (headers_.has("Content-Length")) {
        const std::string cl = HeaderSet::Trim(headers_.value("Content-Length"));
        char* endp = nullptr;
        const long long n = std::strtoll(cl.c_str(), &endp, 10);
        if (cl.empty() || *endp != '\0' || n < 0) {
            return fail("invalid Content-Length");
        }
        bodyRemaining_ = static_cast<size_t>(n);
    } else {
        readUntilClose_ = true;
        keepAlive_ = false;
    }

    state_ = (chunked_ || readUntilClose_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpResponseContext::consumeChunked(Buffer* buf) {
    while (state_ == kExpectBody) {
        if (inTrailer_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) return true;
            const bool empty = crlf == buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            if (empty) state_ = kGotAll;
            continue;
        }

        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) return true;
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            line = HeaderSet::Trim(line);
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (line.empty() || *endp != '\0') {
                return fail("invalid chunk size");
            }
            chunkRemaining_ = static_cast<size_t>(n);
            expectingChunkSize_ = false;
            if (chunkRemaining_ == 0) {
                inTrailer_ = true;
            }
            continue;
        }

        if (chunkRemaining_ > 0) {
            const size_t take = std::min(chunkRemaining_, buf->ReadableBytes());
            if (take == 0) return true;
            body_.append(buf->Peek(), take);
            buf->Retrieve(take);
            chunkRemaining_ -= take;
            continue;
        }

        // CRLF after chunk data
        if (buf->ReadableBytes() < 2) return true;
        if (buf->Peek()[0] != '\r' || buf->Peek()[1] != '\n') {
            return fail("missing CRLF after chunk");
        }
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
    return true;
}

bool HttpResponseContext::parseResponse(Buffer* buf) {
    while (state_ != kError && state_ != kGotAll) {
        if (state_ == kExpectStatusLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                    return fail("response head too large");
                }
                return true;
            }
            headerBytes_ += static_cast<size_t>(crlf + 2 - buf->Peek());
            if (headerBytes_ > kMaxHeaderBytes) {
                return fail("response head too large");
            }
            if (state_ == kExpectStatusLine) {
                if (!processStatusLine(buf->Peek(), crlf)) return false;
                buf->RetrieveUntil(crlf + 2);
                state_ = kExpectHeaders;
                continue;
            }
            if (crlf == buf->Peek()) {
                buf->RetrieveUntil(crlf + 2);
                if (!processHeadersDone()) return false;
                continue;
            }
            const std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);
            const size_t colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                return fail("malformed header line");
            }
            headers_.add(line.substr(0, colon), HeaderSet::Trim(line.substr(colon + 1)));
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!consumeChunked(buf)) return false;
                if (state_ == kExpectBody) return true;
            } else if (readUntilClose_) {
                body_.append(buf->Peek(), buf->ReadableBytes());
                buf->RetrieveAll();
                return true;
            } else {
                const size_t take = std::min(bodyRemaining_, buf->ReadableBytes());
                body_.append(buf->Peek(), take);
                buf->Retrieve(take);
                bodyRemaining_ -= take;
                if (bodyRemaining_ > 0) return true;
                state_ = kGotAll;
            }
        }
    }
    return state_ != kError;
}

bool HttpResponseContext::finishOnClose() {
    if (state_ == kGotAll) return true;
    if (state_ == kExpectBody && readUntilClose_) {
        state_ = kGotAll;
        return true;
    }
    if (state_ != kError) {
        fail(state_ == kExpectBody ? "connection closed before the body was complete"
                                   : "connection closed before a response was received");
    }
    return false;
}

} // namespace protocol
} // namespace mountproxy
