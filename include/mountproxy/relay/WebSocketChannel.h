#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/protocol/WebSocketCodec.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mountproxy {
namespace network {
class Buffer;
class EventLoop;
class TcpConnection;
class Timer;
} // namespace network

namespace relay {

// One endpoint of an established WebSocket: frames messages over a TCP
// connection, answers pings and runs the close handshake. The owner feeds it
// the connection's bytes and disconnect notification. Loop thread only.
class WebSocketChannel : mountproxy::common::noncopyable,
                         public std::enable_shared_from_this<WebSocketChannel> {
public:
    using Opcode = protocol::WebSocketCodec::Opcode;
    // Text and binary messages only.
    using MessageCallback = std::function<void(Opcode opcode, const std::string& payload)>;
    // Fires once when the transport is gone. code/reason come from the peer's
    // close frame: kCloseNoStatus when it had none, kCloseAbnormal when none arrived.
    using ClosedCallback = std::function<void(uint16_t code, const std::string& reason)>;

    // How long to wait for the peer to finish the close handshake.
    static constexpr double kCloseGraceSec = 5.0;

    WebSocketChannel(const network::TcpConnectionPtr& conn, bool serverSide);
    ~WebSocketChannel();

    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetClosedCallback(const ClosedCallback& cb) { closedCallback_ = cb; }

    void OnData(network::Buffer* buf);
    void OnTransportClosed();

    // Returns false once a close frame has been sent or the transport is gone.
    bool Send(Opcode opcode, const std::string& payload);
    // Starts the close handshake; a no-op when it is already under way.
    void Close(uint16_t code, const std::string& reason);

    network::TcpConnectionPtr connection() const { return conn_.lock(); }
    bool closeSent() const { return closeSent_; }
    bool closed() const { return closed_; }
    uint16_t closeCode() const { return closeCode_; }
    const std::string& closeReason() const { return closeReason_; }

private:
    void handleControl(const protocol::WebSocketCodec::Message& msg);
    void sendFrame(const std::string& frame);
    void sendClose(uint16_t code, const std::string& reason);
    void finishTransport();
    void startGraceTimer();
    void forceClose();

    std::weak_ptr<network::TcpConnection> conn_;
    network::EventLoop* loop_;
    const bool serverSide_;
    protocol::WebSocketCodec codec_;

    MessageCallback messageCallback_;
    ClosedCallback closedCallback_;

    bool closeSent_;
    bool closeReceived_;
    bool closed_;
    uint16_t closeCode_;
    std::string closeReason_;
    std::unique_ptr<network::Timer> graceTimer_;
};

} // namespace relay
} // namespace mountproxy
