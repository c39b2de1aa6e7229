#pragma once

#include "mountproxy/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace mountproxy {
namespace network {

class EventLoop;

// A thread that owns and runs one EventLoop. Destruction quits the loop and joins.
class EventLoopThread : mountproxy::common::noncopyable {
public:
    explicit EventLoopThread(std::string name);
    ~EventLoopThread();

    // Spawns the thread and blocks until its loop exists.
    EventLoop* StartLoop();

    const std::string& name() const { return name_; }

private:
    void run();

    const std::string name_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable ready_;
    EventLoop* loop_;
};

} // namespace network
} // namespace mountproxy
