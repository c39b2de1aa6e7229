#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace mountproxy {
namespace network {

// Byte queue for socket I/O: appended at the back, consumed from the front.
// Consumed space is reclaimed lazily when the back runs out of room.
class Buffer {
public:
    explicit Buffer(size_t initialSize = 1024) : storage_(initialSize), head_(0), tail_(0) {}

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) = default;
    Buffer& operator=(Buffer&&) = default;

    size_t ReadableBytes() const { return tail_ - head_; }
    const char* Peek() const { return storage_.data() + head_; }

    // First "\r\n" in the readable region, or nullptr.
    const char* FindCRLF() const;

    void Retrieve(size_t len);
    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }
    void RetrieveAll() { head_ = tail_ = 0; }
    std::string RetrieveAllAsString();

    void Append(const std::string& str) { Append(str.data(), str.size()); }
    void Append(const char* data, size_t len);

    // Reads whatever the socket has. Returns the readv() result; errno goes to *savedErrno.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    void reserve(size_t len);

    std::vector<char> storage_;
    size_t head_;
    size_t tail_;
};

} // namespace network
} // namespace mountproxy
