#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/InetAddress.h"

#include <functional>
#include <memory>

namespace mountproxy {
namespace network {

class Channel;
class EventLoop;

// A single non-blocking connect(). Success hands over the fd, failure
// reports the errno; nothing is retried. Always held by a shared_ptr since
// queued work keeps it alive.
class Connector : public std::enable_shared_from_this<Connector>,
                  mountproxy::common::noncopyable {
public:
    using ConnectedCallback = std::function<void(int sockfd)>;
    using FailedCallback = std::function<void(int savedErrno)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetConnectedCallback(ConnectedCallback cb) { onConnected_ = std::move(cb); }
    void SetFailedCallback(FailedCallback cb) { onFailed_ = std::move(cb); }

    void Start();
    // Abandons a pending attempt; neither callback fires afterwards.
    void Cancel();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    void connectInLoop();
    void watch(int sockfd);
    void onWritable();
    int release();
    void fail(int sockfd, int savedErrno);

    EventLoop* loop_;
    const InetAddress serverAddr_;
    bool wanted_;
    bool pending_;
    std::unique_ptr<Channel> channel_;
    ConnectedCallback onConnected_;
    FailedCallback onFailed_;
};

} // namespace network
} // namespace mountproxy
