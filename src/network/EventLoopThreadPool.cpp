#include "mountproxy/network/EventLoopThreadPool.h"
#include "mountproxy/network/EventLoopThread.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/common/Logger.h"

namespace mountproxy {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, std::string prefix)
    : baseLoop_(baseLoop),
      prefix_(std::move(prefix)),
      numThreads_(0),
      cursor_(0) {
}

// Threads join before loops_ is cleared.
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start() {
    threads_.reserve(static_cast<size_t>(numThreads_));
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(new EventLoopThread(prefix_ + "-io" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
    LOG_INFO << prefix_ << ": " << loops_.size() << " I/O thread(s)";
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) {
        return baseLoop_;
    }
    EventLoop* loop = loops_[cursor_];
    cursor_ = (cursor_ + 1) % loops_.size();
    return loop;
}

} // namespace network
} // namespace mountproxy
