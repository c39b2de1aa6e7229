#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/network/Callbacks.h"
#include "mountproxy/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace mountproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP stream, optionally wrapped in TLS. Lives on a single
// I/O loop; Send/Shutdown/ForceClose and the read toggles may be called from
// any thread and hop to that loop.
class TcpConnection : mountproxy::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    // With a server tlsCtx the first byte decides: 0x16 starts a TLS
    // handshake, anything else is served as plaintext.
    TcpConnection(EventLoop* loop,
                  std::string name,
                  int sockfd,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* serverTlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == State::kConnected; }

    // Client TLS; call before ConnectEstablished(). The connection callback
    // is held back until the handshake completes.
    void SetClientTls(ssl_ctx_st* tlsCtx, const std::string& serverName, bool verifyPeer);

    // Last transport failure (reset, TLS alert, ...), empty if none.
    const std::string& lastError() const { return lastError_; }

    void SetContext(std::any context) { context_ = std::move(context); }
    const std::any& GetContext() const { return context_; }

    void Send(const std::string& data) { Send(data.data(), data.size()); }
    void Send(const void* data, size_t len);
    // Half-closes once the output queue is flushed.
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    void SetTcpNoDelay(bool on);

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetCloseCallback(CloseCallback cb) { closeCallback_ = std::move(cb); }
    void SetWriteCompleteCallback(WriteCompleteCallback cb) { writeCompleteCallback_ = std::move(cb); }
    void SetHighWaterMarkCallback(HighWaterMarkCallback cb, size_t mark) {
        highWaterMarkCallback_ = std::move(cb);
        highWaterMark_ = mark;
    }

    // Owner hooks, each called exactly once on the I/O loop.
    void ConnectEstablished();
    void ConnectDestroyed();

    Buffer* inputBuffer() { return &input_; }

private:
    enum class State { kConnecting, kConnected, kDisconnecting, kDisconnected };
    enum class Tls { kOff, kHandshake, kEstablished };
    enum class Io { kProgress, kAgain, kEof, kFailed };

    void onReadable(std::chrono::system_clock::time_point receiveTime);
    void onWritable();
    void onError();
    void teardown();

    void sendInLoop(const char* data, size_t len);
    void shutdownInLoop();
    void setReadingInLoop(bool on);
    void queueWriteComplete();

    bool awaitingSniff() const { return serverTlsCtx_ != nullptr && !sniffed_; }
    void sniffTls();
    bool attachSsl(ssl_ctx_st* ctx, bool client);
    // False once a failed handshake has torn the connection down.
    bool advanceHandshake();
    void wantSocketWritable();

    Io readTransport(size_t* received);
    Io writeTransport(const char* data, size_t len, size_t* written);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<State> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    size_t highWaterMark_;

    Buffer input_;
    Buffer output_;
    std::any context_;
    std::string lastError_;

    ssl_ctx_st* serverTlsCtx_;
    ssl_ctx_st* clientTlsCtx_;
    std::string tlsServerName_;
    bool tlsVerifyPeer_;
    bool sniffed_;
    ssl_st* ssl_;
    Tls tls_;
};

} // namespace network
} // namespace mountproxy
