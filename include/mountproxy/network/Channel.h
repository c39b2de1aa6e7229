#pragma once

#include "mountproxy/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <memory>

namespace mountproxy {
namespace network {

class EventLoop;

// Routes readiness on one fd to its owner's callbacks. The fd belongs to the owner.
class Channel : mountproxy::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    // Where the poller has the channel.
    enum class PollState { kNew, kWatched, kParked };

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent(std::chrono::system_clock::time_point receiveTime);

    void SetReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    // Events are dropped once obj is gone; it is held for the duration of a dispatch.
    void Tie(const std::shared_ptr<void>& obj);

    int fd() const { return fd_; }
    int events() const { return events_; }
    void set_revents(int revents) { revents_ = revents; }
    bool IsNoneEvent() const { return events_ == 0; }
    bool IsReading() const { return (events_ & kReadEvents) != 0; }
    bool IsWriting() const { return (events_ & kWriteEvents) != 0; }

    void EnableReading() { events_ |= kReadEvents; update(); }
    void DisableReading() { events_ &= ~kReadEvents; update(); }
    void EnableWriting() { events_ |= kWriteEvents; update(); }
    void DisableWriting() { events_ &= ~kWriteEvents; update(); }
    void DisableAll() { events_ = 0; update(); }

    PollState pollState() const { return pollState_; }
    void setPollState(PollState state) { pollState_ = state; }

    // Must follow DisableAll() before the fd is closed.
    void Remove();

private:
    void update();
    void dispatch(std::chrono::system_clock::time_point receiveTime);

    static const int kReadEvents;
    static const int kWriteEvents;

    EventLoop* loop_;
    const int fd_;
    int events_;
    int revents_;
    PollState pollState_;
    bool registered_;

    std::weak_ptr<void> tie_;
    bool tied_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};

} // namespace network
} // namespace mountproxy
