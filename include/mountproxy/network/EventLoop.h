#pragma once

#include "mountproxy/common/noncopyable.h"
#include "mountproxy/network/EpollPoller.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mountproxy {
namespace network {

class Channel;

// Reactor bound to the thread that constructs it. Channels and timers of a
// loop are only touched from that thread; other threads hand work over with
// QueueInLoop().
class EventLoop : mountproxy::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // Runs until Quit(). Must be called on the owning thread.
    void Loop();
    // Safe from any thread; the current iteration finishes first.
    void Quit();

    // Runs cb now when called on the loop thread, otherwise queues it.
    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void WakeUp();

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }

    // Time the last poll returned; used as the receive time of dispatched events.
    std::chrono::system_clock::time_point pollReturnTime() const { return pollReturnTime_; }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void drainWakeup();
    void runPending();

    std::atomic<bool> quit_;
    std::atomic<bool> runningPending_;
    const std::thread::id threadId_;

    std::unique_ptr<EpollPoller> poller_;
    std::chrono::system_clock::time_point pollReturnTime_;
    EpollPoller::ChannelList ready_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;

    std::mutex mutex_;
    std::vector<Functor> pending_;
};

} // namespace network
} // namespace mountproxy
