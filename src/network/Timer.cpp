#include "mountproxy/network/Timer.h"
#include "mountproxy/network/Channel.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

Timer::Timer(EventLoop* loop)
    : loop_(loop),
      timerfd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      armed_(false) {
    if (timerfd_ < 0) {
        LOG_ERROR << "Timer: timerfd_create failed errno=" << errno;
        return;
    }
    channel_.reset(new Channel(loop_, timerfd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Timer::~Timer() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
        // The channel may be mid HandleEvent (the callback destroyed our owner); free it later.
        Channel* ch = channel_.release();
        loop_->QueueInLoop([ch]() { delete ch; });
    }
    if (timerfd_ >= 0) {
        ::close(timerfd_);
    }
}

bool Timer::Start(double delaySec, TimerCallback cb) {
    if (timerfd_ < 0) return false;
    if (delaySec < 0.001) delaySec = 0.001;

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = static_cast<time_t>(delaySec);
    howlong.it_value.tv_nsec = static_cast<long>((delaySec - static_cast<double>(howlong.it_value.tv_sec)) * 1e9);
    if (::timerfd_settime(timerfd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer: timerfd_settime failed errno=" << errno;
        return false;
    }
    callback_ = std::move(cb);
    armed_ = true;
    if (!channel_->IsReading()) channel_->EnableReading();
    return true;
}

void Timer::Cancel() {
    if (!armed_) return;
    armed_ = false;
    callback_ = nullptr;
    struct itimerspec disarm;
    std::memset(&disarm, 0, sizeof disarm);
    ::timerfd_settime(timerfd_, 0, &disarm, nullptr);
    if (channel_ && channel_->IsReading()) channel_->DisableReading();
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations || !armed_) return;

    armed_ = false;
    channel_->DisableReading();
    // Run from a local: the callback may destroy this Timer.
    TimerCallback cb = std::move(callback_);
    callback_ = nullptr;
    if (cb) cb();
}

} // namespace network
} // namespace mountproxy
