#include "mountproxy/protocol/HttpServer.h"
#include "mountproxy/protocol/HttpRequest.h"
#include "mountproxy/protocol/HttpResponse.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/network/Timer.h"
#include "mountproxy/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

using namespace mountproxy::protocol;
using namespace mountproxy::network;
using namespace mountproxy::common;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    const uint16_t port = pickFreePort();
    EventLoop loop;
    Timer slowTimer(&loop);
    HttpServer server(&loop, InetAddress(port), "TestHttpServer");
    server.setHttpCallback([&](const HttpRequest& req, const HttpServer::Responder& respond) {
        LOG_INFO << "HttpServer - Request: " << req.path();

        HttpResponse resp;
        if (req.path() == "/") {
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType("text/html");
            resp.setBody("<html><head><title>MountProxy</title></head>"
                         "<body><h1>Hello from MountProxy</h1></body></html>");
        } else if (req.path() == "/slow") {
            // Answered later; requests pipelined behind it must wait their turn.
            slowTimer.Start(0.1, [respond]() {
                HttpResponse late;
                late.setStatusCode(HttpResponse::k200Ok);
                late.setContentType("text/plain");
                late.setBody("slow answer");
                respond(std::move(late));
            });
            return;
        } else if (req.path() == "/echo") {
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType("text/plain");
            resp.setBody("echo:" + req.body());
        } else if (req.path() == "/quit") {
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType("text/plain");
            resp.setBody("Server Quitting...");
            loop.QueueInLoop([&]() { loop.Quit(); });
        } else {
            resp.setStatusCode(HttpResponse::k404NotFound);
        }
        respond(std::move(resp));
    });
    server.start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        int bad = connectTo(port);
        const char* garbage = "NOT-HTTP\r\n\r\n";
        assert(::send(bad, garbage, std::strlen(garbage), 0) == (ssize_t)std::strlen(garbage));
        std::string badResp = recvUntilClose(bad);
        ::close(bad);
        assert(badResp.find("HTTP/1.1 400 Bad Request") == 0);

        int fd = connectTo(port);
        const char* req =
            "GET / HTTP/1.1\r\n"
            "Host: test\r\n"
            "\r\n"
            "GET /slow HTTP/1.1\r\n"
            "Host: test\r\n"
            "\r\n"
            "POST /echo HTTP/1.1\r\n"
            "Host: test\r\n"
            "Content-Length: 5\r\n"
            "\r\n"
            "hello"
            "GET /missing HTTP/1.1\r\n"
            "Host: test\r\n"
            "\r\n"
            "GET /quit HTTP/1.1\r\n"
            "Host: test\r\n"
            "Connection: close\r\n"
            "\r\n";
        ssize_t n = ::send(fd, req, std::strlen(req), 0);
        assert(n == (ssize_t)std::strlen(req));

        std::string resp = recvUntilClose(fd);
        ::close(fd);

        const size_t home = resp.find("Hello from MountProxy");
        const size_t slow = resp.find("slow answer");
        const size_t echo = resp.find("echo:hello");
        const size_t missing = resp.find("HTTP/1.1 404 Not Found");
        const size_t quit = resp.find("Server Quitting...");
        assert(home != std::string::npos);
        assert(slow != std::string::npos);
        assert(echo != std::string::npos);
        assert(missing != std::string::npos);
        assert(quit != std::string::npos);
        assert(home < slow && slow < echo && echo < missing && missing < quit);
        assert(resp.find("Connection: close\r\n") != std::string::npos);
    });

    loop.Loop();
    client.join();
    return 0;
}
