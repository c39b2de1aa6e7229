#include "mountproxy/MountProxyServer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/protocol/Compression.h"
#include "mountproxy/relay/MountOptions.h"
#include "mountproxy/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using mountproxy::MountProxyServer;
using mountproxy::network::EventLoop;
using mountproxy::network::InetAddress;
using mountproxy::protocol::Compression;
using mountproxy::relay::MountOptions;
using namespace mountproxy::common;

namespace {

const char kMount[] = "/apps/notebook";

const char kPage[] =
    "<!doctype html><html><head><meta charset=\"utf-8\" /></head><body>"
    "<marimo-user-config data-config=\"{&quot;display&quot;:{&quot;theme&quot;:&quot;light&quot;}}\"></marimo-user-config>"
    "<script src=\"/assets/index.js\"></script>"
    "<link href=\"/apps/notebook/assets/kept.css\" rel=\"stylesheet\" />"
    "</body></html>";

static bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

static void sendAll(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

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

static int listenEphemeral(uint16_t* portOut) {
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
    assert(::listen(fd, 16) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    *portOut = ntohs(addr.sin_port);
    assert(*portOut != 0);
    return fd;
}

static uint16_t pickFreePort() {
    uint16_t port = 0;
    int fd = listenEphemeral(&port);
    ::close(fd);
    return port;
}

static std::string recvUntilClose(int fd, int timeoutMs = 5000) {
    std::string out;
    while (pollReadable(fd, timeoutMs)) {
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, buf + n);
    }
    return out;
}

static std::string exchange(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    sendAll(fd, request);
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

static std::string bodyOf(const std::string& resp) {
    size_t pos = resp.find("\r\n\r\n");
    return pos == std::string::npos ? std::string() : resp.substr(pos + 4);
}

// Reads one request (head plus Content-Length body) and answers by target.
static void serveOne(int cfd, std::vector<std::string>* seen, std::mutex* mu) {
    std::string in;
    size_t headEnd = std::string::npos;
    size_t need = 0;
    while (true) {
        if (headEnd == std::string::npos) {
            headEnd = in.find("\r\n\r\n");
            if (headEnd != std::string::npos) {
                size_t cl = in.find("Content-Length: ");
                if (cl != std::string::npos && cl < headEnd) {
                    need = static_cast<size_t>(std::stoul(in.substr(cl + 16)));
                }
            }
        }
        if (headEnd != std::string::npos && in.size() >= headEnd + 4 + need) break;
        if (!pollReadable(cfd, 3000)) return;
        char buf[4096];
        ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
        if (n <= 0) return;
        in.append(buf, buf + n);
    }
    {
        std::lock_guard<std::mutex> lock(*mu);
        seen->push_back(in);
    }

    const std::string target = in.substr(in.find(' ') + 1, in.find(" HTTP/1.1") - in.find(' ') - 1);
    std::string resp;
    if (target == "/") {
        std::string gz;
        assert(Compression::Compress(Compression::Encoding::kGzip, std::string(kPage), &gz));
        resp = "HTTP/1.1 200 OK\r\n"
               "Content-Type: text/html; charset=utf-8\r\n"
               "Content-Encoding: gzip\r\n"
               "X-Frame-Options: SAMEORIGIN\r\n"
               "Content-Length: " + std::to_string(gz.size()) + "\r\n"
               "Connection: close\r\n\r\n" + gz;
    } else if (target.compare(0, 9, "/redirect") == 0) {
        resp = "HTTP/1.1 302 Found\r\nLocation: /login\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
    } else if (target == "/api/echo") {
        const std::string body = in.substr(headEnd + 4);
        // Chunked on purpose: the relay must de-chunk before replying.
        char size[16];
        snprintf(size, sizeof size, "%zx", body.size());
        resp = "HTTP/1.1 201 Created\r\nContent-Type: application/json\r\n"
               "Set-Cookie: a=1\r\nSet-Cookie: b=2\r\n"
               "Transfer-Encoding: chunked\r\nConnection: close\r\n\r\n" +
               std::string(size) + "\r\n" + body + "\r\n0\r\n\r\n";
    } else {
        resp = "HTTP/1.1 404 Not Found\r\nContent-Length: 3\r\nConnection: close\r\n\r\nnah";
    }
    sendAll(cfd, resp);
}

static void backendServer(int lfd, std::atomic<bool>* stop, std::vector<std::string>* seen, std::mutex* mu) {
    while (!stop->load()) {
        if (!pollReadable(lfd, 100)) continue;
        int cfd = ::accept(lfd, nullptr, nullptr);
        if (cfd < 0) continue;
        serveOne(cfd, seen, mu);
        ::close(cfd);
    }
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);

    uint16_t backendPort = 0;
    const int lfd = listenEphemeral(&backendPort);
    std::atomic<bool> stop{false};
    std::vector<std::string> seen;
    std::mutex seenMu;
    std::thread backend(backendServer, lfd, &stop, &seen, &seenMu);

    const uint16_t proxyPort = pickFreePort();
    const uint16_t deadPort = pickFreePort();
    const uint16_t degradedPort = pickFreePort();

    EventLoop loop;

    MountOptions options;
    options.mount = kMount;
    options.originEnv = "NOTEBOOK_ORIGIN";
    options.origin = [backendPort]() { return "http://127.0.0.1:" + std::to_string(backendPort); };
    MountProxyServer proxy(&loop, InetAddress(proxyPort, true), options);
    assert(proxy.bound());
    proxy.Start();

    MountOptions deadOptions = options;
    deadOptions.origin = [deadPort]() { return "http://127.0.0.1:" + std::to_string(deadPort) + "/"; };
    MountProxyServer degraded(&loop, InetAddress(degradedPort, true), deadOptions, "Degraded");
    assert(degraded.bound());
    degraded.Start();

    // Accepts the TCP connection through the backlog but never answers.
    uint16_t silentPort = 0;
    const int silentFd = listenEphemeral(&silentPort);
    const uint16_t slowProxyPort = pickFreePort();
    MountOptions slowOptions = options;
    slowOptions.upstreamTimeoutSec = 0.5;
    slowOptions.origin = [silentPort]() { return "http://127.0.0.1:" + std::to_string(silentPort); };
    MountProxyServer slow(&loop, InetAddress(slowProxyPort, true), slowOptions, "Slow");
    assert(slow.bound());
    slow.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // HTML is decoded, rewritten under the mount and themed from the cookie.
        std::string resp = exchange(proxyPort,
            "GET /apps/notebook/ HTTP/1.1\r\nHost: public.example\r\n"
            "Accept-Encoding: gzip, br\r\nCookie: theme=dark\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(resp.find("Content-Encoding") == std::string::npos);
        assert(resp.find("X-Frame-Options") == std::string::npos);
        assert(resp.find("X-Robots-Tag: noindex\r\n") != std::string::npos);
        assert(resp.find("Vary: Cookie\r\n") != std::string::npos);
        std::string body = bodyOf(resp);
        assert(body.find("<head><meta charset=\"utf-8\" /></head>") == std::string::npos);
        assert(body.find("<base href=\"/apps/notebook/\" />") != std::string::npos);
        assert(body.find("src=\"/apps/notebook/assets/index.js\"") != std::string::npos);
        assert(body.find("href=\"/apps/notebook/assets/kept.css\"") != std::string::npos);
        assert(body.find("&quot;theme&quot;:&quot;dark&quot;") != std::string::npos);
        assert(resp.find("Content-Length: " + std::to_string(body.size()) + "\r\n") != std::string::npos);

        // Redirects from the upstream stay inside the mount; the query is forwarded.
        resp = exchange(proxyPort,
            "GET /apps/notebook/redirect?next=%2Fx HTTP/1.1\r\nHost: public.example\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 302 Found\r\n") == 0);
        assert(resp.find("Location: /apps/notebook/login\r\n") != std::string::npos);

        // Bodies go up, chunked answers come back de-chunked with every Set-Cookie.
        resp = exchange(proxyPort,
            "POST /apps/notebook/api/echo HTTP/1.1\r\nHost: public.example\r\n"
            "Content-Type: application/json\r\nContent-Length: 11\r\nConnection: close\r\n\r\n{\"ping\":1}\n");
        assert(resp.find("HTTP/1.1 201 Created\r\n") == 0);
        assert(resp.find("Transfer-Encoding") == std::string::npos);
        assert(resp.find("Set-Cookie: a=1\r\n") != std::string::npos);
        assert(resp.find("Set-Cookie: b=2\r\n") != std::string::npos);
        assert(bodyOf(resp) == "{\"ping\":1}\n");

        // Upstream errors are relayed as-is.
        resp = exchange(proxyPort, "GET /apps/notebook/nope HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 404 Not Found\r\n") == 0);
        assert(bodyOf(resp) == "nah");

        // Handled locally.
        resp = exchange(proxyPort, "GET /apps/notebook HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 307 Temporary Redirect\r\n") == 0);
        assert(resp.find("Location: /apps/notebook/\r\n") != std::string::npos);

        resp = exchange(proxyPort, "GET /elsewhere HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 404 Not Found\r\n") == 0);
        assert(bodyOf(resp) == "Not Found");

        // Unreachable origin.
        resp = exchange(degradedPort, "GET /apps/notebook/ HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 502 Bad Gateway\r\n") == 0);
        assert(resp.find("Content-Type: text/html; charset=utf-8\r\n") != std::string::npos);
        assert(resp.find("<title>Embed unavailable</title>") != std::string::npos);
        assert(resp.find("<code>NOTEBOOK_ORIGIN</code>") != std::string::npos);
        assert(resp.find("<code>http://127.0.0.1:" + std::to_string(deadPort) + "/</code>") != std::string::npos);

        // An upstream that never answers falls back to the degraded page.
        const auto started = std::chrono::steady_clock::now();
        resp = exchange(slowProxyPort, "GET /apps/notebook/ HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        const auto waited = std::chrono::steady_clock::now() - started;
        assert(resp.find("HTTP/1.1 502 Bad Gateway\r\n") == 0);
        assert(resp.find("<title>Embed unavailable</title>") != std::string::npos);
        assert(resp.find("timed out") != std::string::npos);
        assert(waited >= std::chrono::milliseconds(400));
        assert(waited < std::chrono::seconds(4));

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    stop.store(true);
    backend.join();
    ::close(lfd);
    ::close(silentFd);

    std::lock_guard<std::mutex> lock(seenMu);
    assert(seen.size() == 4);
    const std::string& first = seen[0];
    assert(first.find("GET / HTTP/1.1\r\n") == 0);
    assert(first.find("Host: 127.0.0.1:" + std::to_string(backendPort) + "\r\n") != std::string::npos);
    assert(first.find("public.example") == std::string::npos);
    assert(first.find("Cookie: theme=dark\r\n") != std::string::npos);
    assert(first.find("Accept-Encoding: gzip\r\n") != std::string::npos);
    assert(seen[1].find("GET /redirect?next=%2Fx HTTP/1.1\r\n") == 0);
    assert(seen[2].find("POST /api/echo HTTP/1.1\r\n") == 0);
    assert(seen[2].find("Content-Length: 11\r\n") != std::string::npos);
    return 0;
}
