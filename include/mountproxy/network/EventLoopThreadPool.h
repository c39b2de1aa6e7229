#pragma once

#include "mountproxy/common/noncopyable.h"

#include <memory>
#include <string>
#include <vector>

namespace mountproxy {
namespace network {

class EventLoop;
class EventLoopThread;

// I/O loops for accepted connections. With zero threads everything stays on the base loop.
class EventLoopThreadPool : mountproxy::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, std::string prefix);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Hands out the worker loops in turn.
    EventLoop* GetNextLoop();

private:
    EventLoop* baseLoop_;
    const std::string prefix_;
    int numThreads_;
    size_t cursor_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace mountproxy
