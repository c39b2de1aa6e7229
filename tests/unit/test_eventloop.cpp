#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/network/Resolver.h"
#include "mountproxy/network/Timer.h"
#include "mountproxy/common/Logger.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using namespace mountproxy::network;
using namespace mountproxy::common;

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);
    LOG_INFO << "Starting EventLoop test";

    EventLoop loop;
    const std::thread::id loopThread = std::this_thread::get_id();
    Resolver resolver;
    Timer timer(&loop);
    Timer cancelled(&loop);

    bool queued = false;
    bool literalResolved = false;
    bool nameAnswered = false;
    bool cancelledFired = false;
    int answers = 0;

    auto maybeQuit = [&]() {
        if (++answers == 3) loop.Quit();
    };

    // Work queued from another thread runs on the loop thread.
    std::thread t([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        loop.QueueInLoop([&]() {
            assert(std::this_thread::get_id() == loopThread);
            queued = true;
            maybeQuit();
        });
    });

    assert(cancelled.Start(0.05, [&]() { cancelledFired = true; }));
    cancelled.Cancel();
    assert(!cancelled.armed());

    assert(timer.Start(0.1, [&]() {
        LOG_INFO << "Timer fired, resolving";
        resolver.Resolve(&loop, "127.0.0.1", 8080, [&](bool ok, const InetAddress& addr, const std::string& error) {
            assert(std::this_thread::get_id() == loopThread);
            assert(ok);
            assert(error.empty());
            assert(addr.toIpPort() == "127.0.0.1:8080");
            literalResolved = true;
            maybeQuit();
        });
        resolver.Resolve(&loop, "localhost", 80, [&](bool ok, const InetAddress& addr, const std::string& error) {
            assert(std::this_thread::get_id() == loopThread);
            LOG_INFO << "localhost -> " << (ok ? addr.toIp() : error);
            nameAnswered = true;
            maybeQuit();
        });
    }));

    loop.Loop();
    t.join();

    assert(queued);
    assert(literalResolved);
    assert(nameAnswered);
    assert(!cancelledFired);

    InetAddress bad;
    std::string error;
    assert(!Resolver::ResolveBlocking("no-such-host.invalid", 80, &bad, &error));
    assert(!error.empty());

    LOG_INFO << "Main loop test passed";
    return 0;
}
