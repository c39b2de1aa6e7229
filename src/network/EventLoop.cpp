#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/Channel.h"
#include "mountproxy/common/Logger.h"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>

namespace mountproxy {
namespace network {

namespace {

thread_local EventLoop* t_currentLoop = nullptr;

const int kPollTimeoutMs = 10000;

// Writes to a vanished peer must fail with EPIPE instead of raising SIGPIPE.
struct SigPipeIgnorer {
    SigPipeIgnorer() { ::signal(SIGPIPE, SIG_IGN); }
};
SigPipeIgnorer g_sigPipeIgnorer;

int OpenWakeupFd() {
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "EventLoop: eventfd failed: " << std::strerror(errno);
    }
    return fd;
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_currentLoop;
}

EventLoop::EventLoop()
    : quit_(false),
      runningPending_(false),
      threadId_(std::this_thread::get_id()),
      poller_(new EpollPoller()),
      pollReturnTime_(std::chrono::system_clock::now()),
      wakeupFd_(OpenWakeupFd()),
      wakeupChannel_(new Channel(this, wakeupFd_)) {
    if (t_currentLoop) {
        LOG_FATAL << "EventLoop: thread already owns loop " << t_currentLoop;
    } else {
        t_currentLoop = this;
    }
    wakeupChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) { drainWakeup(); });
    wakeupChannel_->EnableReading();
}

EventLoop::~EventLoop() {
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    if (t_currentLoop == this) {
        t_currentLoop = nullptr;
    }
}

void EventLoop::Loop() {
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " running";

    while (!quit_) {
        ready_.clear();
        pollReturnTime_ = poller_->Poll(kPollTimeoutMs, &ready_);
        for (Channel* channel : ready_) {
            try {
                channel->HandleEvent(pollReturnTime_);
            } catch (const std::exception& e) {
                LOG_ERROR << "EventLoop: handler for fd=" << channel->fd() << " threw: " << e.what();
            }
        }
        runPending();
    }

    LOG_DEBUG << "EventLoop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(cb));
    }
    // Work queued by a pending functor would otherwise wait for the next poll timeout.
    if (!IsInLoopThread() || runningPending_) {
        WakeUp();
    }
}

void EventLoop::WakeUp() {
    const uint64_t one = 1;
    if (::write(wakeupFd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_ERROR << "EventLoop: wakeup write failed: " << std::strerror(errno);
    }
}

void EventLoop::drainWakeup() {
    uint64_t count = 0;
    if (::read(wakeupFd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_ERROR << "EventLoop: wakeup read failed: " << std::strerror(errno);
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) const {
    return poller_->HasChannel(channel);
}

void EventLoop::runPending() {
    std::vector<Functor> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pending_);
    }

    runningPending_ = true;
    for (Functor& fn : batch) {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR << "EventLoop: queued task threw: " << e.what();
        }
    }
    runningPending_ = false;
}

} // namespace network
} // namespace mountproxy
