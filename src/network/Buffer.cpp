#include "mountproxy/network/Buffer.h"

#include <sys/uio.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

namespace {
const size_t kStackReadSize = 64 * 1024;
}

const char* Buffer::FindCRLF() const {
    const char* begin = Peek();
    const char* end = begin + ReadableBytes();
    static const char kCRLF[] = "\r\n";
    const char* hit = std::search(begin, end, kCRLF, kCRLF + 2);
    return hit == end ? nullptr : hit;
}

void Buffer::Retrieve(size_t len) {
    if (len >= ReadableBytes()) {
        RetrieveAll();
        return;
    }
    head_ += len;
}

std::string Buffer::RetrieveAllAsString() {
    std::string out(Peek(), ReadableBytes());
    RetrieveAll();
    return out;
}

void Buffer::Append(const char* data, size_t len) {
    reserve(len);
    std::memcpy(storage_.data() + tail_, data, len);
    tail_ += len;
}

void Buffer::reserve(size_t len) {
    if (storage_.size() - tail_ >= len) {
        return;
    }
    const size_t readable = ReadableBytes();
    if (head_ > 0) {
        std::memmove(storage_.data(), storage_.data() + head_, readable);
        head_ = 0;
        tail_ = readable;
    }
    if (storage_.size() - tail_ < len) {
        storage_.resize(std::max(storage_.size() * 2, tail_ + len));
    }
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    // Spill into the stack so one call drains the socket without preallocating.
    char spill[kStackReadSize];
    const size_t room = storage_.size() - tail_;

    struct iovec vec[2];
    vec[0].iov_base = storage_.data() + tail_;
    vec[0].iov_len = room;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;

    const ssize_t n = ::readv(fd, vec, room < sizeof spill ? 2 : 1);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }
    if (static_cast<size_t>(n) <= room) {
        tail_ += static_cast<size_t>(n);
    } else {
        tail_ = storage_.size();
        Append(spill, static_cast<size_t>(n) - room);
    }
    return n;
}

} // namespace network
} // namespace mountproxy
