#include "mountproxy/network/Connector.h"
#include "mountproxy/network/Channel.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/Socket.h"
#include "mountproxy/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      wanted_(false),
      pending_(false) {
}

Connector::~Connector() = default;

void Connector::Start() {
    wanted_ = true;
    loop_->RunInLoop([self = shared_from_this()] { self->connectInLoop(); });
}

void Connector::Cancel() {
    wanted_ = false;
    loop_->QueueInLoop([self = shared_from_this()] {
        if (self->pending_) {
            self->pending_ = false;
            ::close(self->release());
        }
    });
}

void Connector::connectInLoop() {
    if (!wanted_) {
        return;
    }
    const int sockfd = Socket::CreateNonblocking();
    if (sockfd < 0) {
        fail(-1, errno);
        return;
    }
    const int rc = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int err = rc == 0 ? 0 : errno;
    if (err == 0 || err == EINPROGRESS || err == EINTR || err == EISCONN) {
        watch(sockfd);
        return;
    }
    fail(sockfd, err);
}

void Connector::watch(int sockfd) {
    pending_ = true;
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback([this] { onWritable(); });
    // An error event is resolved the same way: SO_ERROR tells which.
    channel_->SetErrorCallback([this] { onWritable(); });
    channel_->Tie(shared_from_this());
    channel_->EnableWriting();
}

int Connector::release() {
    channel_->DisableAll();
    channel_->Remove();
    const int sockfd = channel_->fd();
    // Still inside the channel's dispatch; free it on the next turn.
    loop_->QueueInLoop([self = shared_from_this()] { self->channel_.reset(); });
    return sockfd;
}

void Connector::onWritable() {
    if (!pending_) {
        return;
    }
    pending_ = false;
    const int sockfd = release();
    const int err = Socket::SocketError(sockfd);
    if (err != 0) {
        fail(sockfd, err);
        return;
    }
    if (!wanted_ || !onConnected_) {
        ::close(sockfd);
        return;
    }
    onConnected_(sockfd);
}

void Connector::fail(int sockfd, int savedErrno) {
    if (sockfd >= 0) {
        ::close(sockfd);
    }
    if (savedErrno == 0) {
        savedErrno = ECONNABORTED;
    }
    LOG_DEBUG << "Connector: " << serverAddr_.toIpPort() << ": " << std::strerror(savedErrno);
    if (!wanted_) {
        return;
    }
    wanted_ = false;
    // Reported on a fresh stack so Start() never calls back synchronously.
    loop_->QueueInLoop([self = shared_from_this(), savedErrno] {
        if (self->onFailed_) {
            self->onFailed_(savedErrno);
        }
    });
}

} // namespace network
} // namespace mountproxy
