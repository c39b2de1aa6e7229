#include "mountproxy/network/EventLoopThread.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/common/Logger.h"

#include <pthread.h>

namespace mountproxy {
namespace network {

EventLoopThread::EventLoopThread(std::string name)
    : name_(std::move(name)),
      loop_(nullptr) {
}

EventLoopThread::~EventLoopThread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_) {
            loop_->Quit();
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread([this] { run(); });
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::run() {
    // Linux caps thread names at 15 characters.
    ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());

    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
    }
    ready_.notify_one();

    LOG_DEBUG << "EventLoopThread " << name_ << " started";
    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace mountproxy
