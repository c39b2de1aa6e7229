#include "mountproxy/network/EpollPoller.h"
#include "mountproxy/network/Channel.h"
#include "mountproxy/common/Logger.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mountproxy {
namespace network {

namespace {

const size_t kInitialEvents = 32;

const char* OpName(int op) {
    switch (op) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
        default: return "?";
    }
}

} // namespace

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitialEvents) {
    if (epollfd_ < 0) {
        LOG_FATAL << "EpollPoller: epoll_create1 failed: " << std::strerror(errno);
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeoutMs, ChannelList* active) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) {
            LOG_ERROR << "EpollPoller: epoll_wait failed: " << std::strerror(savedErrno);
        }
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(static_cast<int>(events_[i].events));
        active->push_back(channel);
    }
    // A full batch suggests more are waiting; grow for the next round.
    if (static_cast<size_t>(n) == events_.size()) {
        events_.resize(events_.size() * 2);
    }
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    switch (channel->pollState()) {
        case Channel::PollState::kNew:
            channels_[channel->fd()] = channel;
            // fall through
        case Channel::PollState::kParked:
            if (channel->IsNoneEvent()) {
                // No interest yet; known to the poller but not in the epoll set.
                channel->setPollState(Channel::PollState::kParked);
                return;
            }
            control(EPOLL_CTL_ADD, channel);
            channel->setPollState(Channel::PollState::kWatched);
            return;
        case Channel::PollState::kWatched:
            if (channel->IsNoneEvent()) {
                control(EPOLL_CTL_DEL, channel);
                channel->setPollState(Channel::PollState::kParked);
            } else {
                control(EPOLL_CTL_MOD, channel);
            }
            return;
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    LOG_DEBUG << "EpollPoller: remove fd=" << channel->fd();
    channels_.erase(channel->fd());
    if (channel->pollState() == Channel::PollState::kWatched) {
        control(EPOLL_CTL_DEL, channel);
    }
    channel->setPollState(Channel::PollState::kNew);
}

bool EpollPoller::HasChannel(const Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void EpollPoller::control(int op, Channel* channel) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof ev);
    ev.events = static_cast<uint32_t>(channel->events());
    ev.data.ptr = channel;
    if (::epoll_ctl(epollfd_, op, channel->fd(), &ev) < 0) {
        // A DEL on an fd the kernel already dropped is harmless.
        if (op == EPOLL_CTL_DEL) {
            LOG_ERROR << "EpollPoller: epoll_ctl " << OpName(op) << " fd=" << channel->fd()
                      << " failed: " << std::strerror(errno);
        } else {
            LOG_FATAL << "EpollPoller: epoll_ctl " << OpName(op) << " fd=" << channel->fd()
                      << " failed: " << std::strerror(errno);
        }
    }
}

} // namespace network
} // namespace mountproxy
