#include "mountproxy/network/Channel.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/common/Logger.h"

#include <sys/epoll.h>

namespace mountproxy {
namespace network {

const int Channel::kReadEvents = EPOLLIN | EPOLLPRI | EPOLLRDHUP;
const int Channel::kWriteEvents = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      pollState_(PollState::kNew),
      registered_(false),
      tied_(false) {
}

Channel::~Channel() {
    if (registered_ && loop_->HasChannel(this)) {
        LOG_ERROR << "Channel fd=" << fd_ << " destroyed while still registered";
    }
}

void Channel::Tie(const std::shared_ptr<void>& obj) {
    tie_ = obj;
    tied_ = true;
}

void Channel::update() {
    registered_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    registered_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if (!tied_) {
        dispatch(receiveTime);
        return;
    }
    std::shared_ptr<void> guard = tie_.lock();
    if (guard) {
        dispatch(receiveTime);
    }
}

void Channel::dispatch(std::chrono::system_clock::time_point receiveTime) {
    // Hang-up with nothing left to read: the read path would not see it.
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (closeCallback_) closeCallback_();
    }
    if ((revents_ & EPOLLERR) && errorCallback_) {
        errorCallback_();
    }
    if ((revents_ & kReadEvents) && readCallback_) {
        readCallback_(receiveTime);
    }
    if ((revents_ & EPOLLOUT) && writeCallback_) {
        writeCallback_();
    }
}

} // namespace network
} // namespace mountproxy
