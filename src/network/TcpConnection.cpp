#include "mountproxy/network/TcpConnection.h"
#include "mountproxy/network/Channel.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/Socket.h"
#include "mountproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

namespace {

const size_t kDefaultHighWaterMark = 64 * 1024 * 1024;
const size_t kTlsReadChunk = 16 * 1024;
const unsigned char kTlsHandshakeRecord = 0x16;

std::string SslErrorText(int sslError) {
    const unsigned long queued = ERR_get_error();
    if (queued != 0) {
        char text[256];
        ERR_error_string_n(queued, text, sizeof text);
        ERR_clear_error();
        return text;
    }
    if (sslError == SSL_ERROR_SYSCALL && errno != 0) {
        return std::strerror(errno);
    }
    return "ssl error " + std::to_string(sslError);
}

bool WouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             std::string name,
                             int sockfd,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* serverTlsCtx)
    : loop_(loop),
      name_(std::move(name)),
      state_(State::kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      peerAddr_(peerAddr),
      highWaterMark_(kDefaultHighWaterMark),
      serverTlsCtx_(serverTlsCtx),
      clientTlsCtx_(nullptr),
      tlsVerifyPeer_(false),
      sniffed_(false),
      ssl_(nullptr),
      tls_(Tls::kOff) {
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point t) { onReadable(t); });
    channel_->SetWriteCallback([this] { onWritable(); });
    channel_->SetCloseCallback([this] { teardown(); });
    channel_->SetErrorCallback([this] { onError(); });
    socket_->SetKeepAlive(true);
    LOG_DEBUG << "TcpConnection[" << name_ << "] fd=" << sockfd << " peer=" << peerAddr_.toIpPort();
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection[" << name_ << "] released fd=" << channel_->fd();
    if (ssl_) {
        SSL_free(ssl_);
    }
}

void TcpConnection::SetClientTls(ssl_ctx_st* tlsCtx, const std::string& serverName, bool verifyPeer) {
    clientTlsCtx_ = tlsCtx;
    tlsServerName_ = serverName;
    tlsVerifyPeer_ = verifyPeer;
}

void TcpConnection::ConnectEstablished() {
    state_ = State::kConnected;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (clientTlsCtx_) {
        if (!attachSsl(clientTlsCtx_, true)) {
            teardown();
            return;
        }
        advanceHandshake();
        return;
    }
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == State::kConnected) {
        state_ = State::kDisconnected;
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::attachSsl(ssl_ctx_st* ctx, bool client) {
    SSL* ssl = SSL_new(ctx);
    if (!ssl) {
        lastError_ = "TLS: SSL_new failed: " + SslErrorText(SSL_ERROR_SSL);
        LOG_ERROR << "TcpConnection[" << name_ << "] " << lastError_;
        return false;
    }
    SSL_set_fd(ssl, channel_->fd());
    SSL_set_mode(ssl, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    if (client) {
        SSL_set_connect_state(ssl);
        if (!tlsServerName_.empty()) {
            SSL_set_tlsext_host_name(ssl, tlsServerName_.c_str());
            if (tlsVerifyPeer_) {
                SSL_set1_host(ssl, tlsServerName_.c_str());
            }
        }
        SSL_set_verify(ssl, tlsVerifyPeer_ ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    } else {
        SSL_set_accept_state(ssl);
    }
    ssl_ = ssl;
    tls_ = Tls::kHandshake;
    return true;
}

void TcpConnection::sniffTls() {
    unsigned char first = 0;
    if (::recv(channel_->fd(), &first, 1, MSG_PEEK) <= 0) {
        // EOF or error; the read below reports it.
        return;
    }
    sniffed_ = true;
    if (first == kTlsHandshakeRecord) {
        attachSsl(serverTlsCtx_, false);
    }
}

void TcpConnection::wantSocketWritable() {
    if (!channel_->IsWriting()) {
        channel_->EnableWriting();
    }
}

bool TcpConnection::advanceHandshake() {
    if (tls_ != Tls::kHandshake) {
        return true;
    }
    ERR_clear_error();
    const int rc = SSL_do_handshake(ssl_);
    if (rc != 1) {
        const int err = SSL_get_error(ssl_, rc);
        if (err == SSL_ERROR_WANT_READ) {
            return true;
        }
        if (err == SSL_ERROR_WANT_WRITE) {
            wantSocketWritable();
            return true;
        }
        lastError_ = "TLS handshake failed: " + SslErrorText(err);
        LOG_WARN << "TcpConnection[" << name_ << "] " << lastError_;
        teardown();
        return false;
    }

    tls_ = Tls::kEstablished;
    LOG_DEBUG << "TcpConnection[" << name_ << "] TLS " << SSL_get_version(ssl_);
    // Anything queued while handshaking goes out now.
    if (output_.ReadableBytes() > 0) {
        wantSocketWritable();
    } else if (channel_->IsWriting()) {
        channel_->DisableWriting();
    }
    if (clientTlsCtx_ && connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
    return true;
}

TcpConnection::Io TcpConnection::readTransport(size_t* received) {
    *received = 0;
    if (!ssl_) {
        int savedErrno = 0;
        const ssize_t n = input_.ReadFd(channel_->fd(), &savedErrno);
        if (n > 0) {
            *received = static_cast<size_t>(n);
            return Io::kProgress;
        }
        if (n == 0) {
            return Io::kEof;
        }
        if (WouldBlock(savedErrno)) {
            return Io::kAgain;
        }
        lastError_ = std::strerror(savedErrno);
        return Io::kFailed;
    }

    // SSL may buffer several records per socket read; pull until it wants input.
    char chunk[kTlsReadChunk];
    for (;;) {
        ERR_clear_error();
        const int n = SSL_read(ssl_, chunk, sizeof chunk);
        if (n > 0) {
            input_.Append(chunk, static_cast<size_t>(n));
            *received += static_cast<size_t>(n);
            continue;
        }
        const int err = SSL_get_error(ssl_, n);
        switch (err) {
            case SSL_ERROR_WANT_WRITE:
                wantSocketWritable();
                return Io::kAgain;
            case SSL_ERROR_WANT_READ:
                return Io::kAgain;
            case SSL_ERROR_ZERO_RETURN:
                return Io::kEof;
            default:
                break;
        }
        // Peers that drop the socket without close_notify still mean EOF here.
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && errno == 0) {
            return Io::kEof;
        }
        lastError_ = "TLS read failed: " + SslErrorText(err);
        return Io::kFailed;
    }
}

TcpConnection::Io TcpConnection::writeTransport(const char* data, size_t len, size_t* written) {
    *written = 0;
    if (len == 0) {
        return Io::kProgress;
    }
    if (ssl_) {
        ERR_clear_error();
        const int n = SSL_write(ssl_, data, static_cast<int>(len));
        if (n > 0) {
            *written = static_cast<size_t>(n);
            return Io::kProgress;
        }
        const int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
            return Io::kAgain;
        }
        lastError_ = "TLS write failed: " + SslErrorText(err);
        return Io::kFailed;
    }

    const ssize_t n = ::write(channel_->fd(), data, len);
    if (n >= 0) {
        *written = static_cast<size_t>(n);
        return Io::kProgress;
    }
    if (WouldBlock(errno)) {
        return Io::kAgain;
    }
    lastError_ = std::strerror(errno);
    return Io::kFailed;
}

void TcpConnection::onReadable(std::chrono::system_clock::time_point receiveTime) {
    if (awaitingSniff()) {
        sniffTls();
    }
    if (tls_ == Tls::kHandshake) {
        if (!advanceHandshake() || tls_ != Tls::kEstablished) {
            return;
        }
    }

    size_t received = 0;
    const Io status = readTransport(&received);
    if (received > 0) {
        // Copied: an upgrade may install a different handler from inside the call.
        MessageCallback handler = messageCallback_;
        if (handler) {
            handler(shared_from_this(), &input_, receiveTime);
        }
    }
    if (status == Io::kFailed) {
        LOG_DEBUG << "TcpConnection[" << name_ << "] read: " << lastError_;
        teardown();
    } else if (status == Io::kEof) {
        teardown();
    }
}

void TcpConnection::onWritable() {
    if (tls_ == Tls::kHandshake) {
        if (!advanceHandshake() || tls_ != Tls::kEstablished) {
            return;
        }
    }
    if (!channel_->IsWriting()) {
        return;
    }
    if (output_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        return;
    }

    size_t written = 0;
    const Io status = writeTransport(output_.Peek(), output_.ReadableBytes(), &written);
    if (status == Io::kFailed) {
        LOG_DEBUG << "TcpConnection[" << name_ << "] write: " << lastError_;
        teardown();
        return;
    }
    output_.Retrieve(written);
    if (output_.ReadableBytes() > 0) {
        return;
    }
    channel_->DisableWriting();
    queueWriteComplete();
    if (state_ == State::kDisconnecting) {
        shutdownInLoop();
    }
}

void TcpConnection::onError() {
    const int err = Socket::SocketError(channel_->fd());
    if (err != 0) {
        lastError_ = std::strerror(err);
        LOG_DEBUG << "TcpConnection[" << name_ << "] SO_ERROR: " << lastError_;
    }
}

void TcpConnection::teardown() {
    if (state_ == State::kDisconnected) {
        return;
    }
    state_ = State::kDisconnected;
    channel_->DisableAll();
    LOG_DEBUG << "TcpConnection[" << name_ << "] closed";

    TcpConnectionPtr self(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(self);
    }
    if (closeCallback_) {
        closeCallback_(self);
    }
}

void TcpConnection::queueWriteComplete() {
    if (writeCompleteCallback_) {
        loop_->QueueInLoop([cb = writeCompleteCallback_, self = shared_from_this()] { cb(self); });
    }
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != State::kConnected) {
        return;
    }
    const char* bytes = static_cast<const char*>(data);
    if (loop_->IsInLoopThread()) {
        sendInLoop(bytes, len);
        return;
    }
    loop_->QueueInLoop([self = shared_from_this(), copy = std::string(bytes, len)] {
        self->sendInLoop(copy.data(), copy.size());
    });
}

void TcpConnection::sendInLoop(const char* data, size_t len) {
    if (state_ == State::kDisconnected) {
        LOG_DEBUG << "TcpConnection[" << name_ << "] dropped " << len << " bytes after close";
        return;
    }

    size_t written = 0;
    const bool transportReady = ssl_ ? tls_ == Tls::kEstablished : !awaitingSniff();
    if (transportReady && !channel_->IsWriting() && output_.ReadableBytes() == 0) {
        const Io status = writeTransport(data, len, &written);
        if (status == Io::kFailed) {
            // The poller reports the broken socket and closes it.
            LOG_DEBUG << "TcpConnection[" << name_ << "] send: " << lastError_;
            return;
        }
        if (written == len) {
            queueWriteComplete();
            return;
        }
    }

    const size_t remaining = len - written;
    const size_t queued = output_.ReadableBytes();
    if (highWaterMarkCallback_ && queued < highWaterMark_ && queued + remaining >= highWaterMark_) {
        loop_->QueueInLoop([cb = highWaterMarkCallback_, self = shared_from_this(), total = queued + remaining] {
            cb(self, total);
        });
    }
    output_.Append(data + written, remaining);
    if (tls_ != Tls::kHandshake) {
        wantSocketWritable();
    }
}

void TcpConnection::Shutdown() {
    State expected = State::kConnected;
    if (state_.compare_exchange_strong(expected, State::kDisconnecting)) {
        loop_->RunInLoop([self = shared_from_this()] { self->shutdownInLoop(); });
    }
}

void TcpConnection::shutdownInLoop() {
    // Still flushing; onWritable() comes back here when the queue drains.
    if (channel_->IsWriting()) {
        return;
    }
    if (tls_ == Tls::kEstablished) {
        ERR_clear_error();
        SSL_shutdown(ssl_);
    }
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    if (state_ == State::kDisconnected) {
        return;
    }
    loop_->RunInLoop([self = shared_from_this()] { self->teardown(); });
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()] { self->setReadingInLoop(true); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()] { self->setReadingInLoop(false); });
}

void TcpConnection::setReadingInLoop(bool on) {
    if (state_ == State::kDisconnected || reading_ == on) {
        return;
    }
    reading_ = on;
    if (on) {
        channel_->EnableReading();
    } else {
        channel_->DisableReading();
    }
}

void TcpConnection::SetTcpNoDelay(bool on) {
    socket_->SetTcpNoDelay(on);
}

} // namespace network
} // namespace mountproxy
