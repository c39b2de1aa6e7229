#pragma once

#include "mountproxy/common/noncopyable.h"

#include <functional>
#include <memory>

namespace mountproxy {
namespace network {

class Channel;
class EventLoop;

// One-shot timerfd timer bound to a loop. Create, arm and destroy in the loop thread.
class Timer : mountproxy::common::noncopyable {
public:
    using TimerCallback = std::function<void()>;

    explicit Timer(EventLoop* loop);
    ~Timer();

    // (Re)arms the timer. Returns false when the timerfd could not be created/set.
    bool Start(double delaySec, TimerCallback cb);
    void Cancel();
    bool armed() const { return armed_; }

private:
    void HandleRead();

    EventLoop* loop_;
    int timerfd_;
    std::unique_ptr<Channel> channel_;
    TimerCallback callback_;
    bool armed_;
};

} // namespace network
} // namespace mountproxy
