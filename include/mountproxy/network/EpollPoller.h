#pragma once

#include "mountproxy/common/noncopyable.h"

#include <chrono>
#include <unordered_map>
#include <vector>

#include <sys/epoll.h>

namespace mountproxy {
namespace network {

class Channel;

// Level-triggered epoll set for one EventLoop. Loop thread only.
class EpollPoller : mountproxy::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Waits up to timeoutMs and appends the ready channels. Returns the wake-up time.
    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* active);

    // Registers, modifies or parks the channel according to its interest set.
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(const Channel* channel) const;

private:
    void control(int op, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace mountproxy
