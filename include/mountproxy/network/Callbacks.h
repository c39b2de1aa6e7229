#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace mountproxy {
namespace network {

class Buffer;
class TcpConnection;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Fires on connect and again on disconnect; check conn->connected().
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
// Bytes arrived. Consume what is complete and leave the rest in the buffer.
using MessageCallback =
    std::function<void(const TcpConnectionPtr&, Buffer*, std::chrono::system_clock::time_point)>;
// Owner-side teardown hook.
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;

// Output buffer drained.
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;
// Output buffer grew past the mark; second argument is the queued byte count.
using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, size_t)>;

// Outbound connect gave up; the argument says why.
using ConnectFailedCallback = std::function<void(const std::string&)>;

} // namespace network
} // namespace mountproxy
