#include "mountproxy/relay/UrlTranslator.h"
#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace mountproxy::relay;
using mountproxy::protocol::HeaderSet;
using namespace mountproxy::common;

static const std::string kMount = "/marimo/semantic-entropy-probe-comparison";

void testBuildUpstreamUrl() {
    assert(BuildUpstreamUrl("http://up", "", "") == "http://up/");
    assert(BuildUpstreamUrl("http://up/", "/a/b", "") == "http://up/a/b");
    assert(BuildUpstreamUrl("http://up///", "//a", "x=1&y=2") == "http://up/a?x=1&y=2");
    assert(BuildUpstreamUrl("https://up:8443/base", "assets/app.js", "") == "https://up:8443/base/assets/app.js");
    // Trailing slashes on the path are kept.
    assert(BuildUpstreamUrl("http://up", "dir/", "") == "http://up/dir/");
    LOG_INFO << "BuildUpstreamUrl PASS";
}

void testForwardRequestHeaders() {
    HeaderSet in;
    in.add("Host", "proxy.example");
    in.add("Content-Length", "5");
    in.add("Connection", "keep-alive");
    in.add("Keep-Alive", "timeout=5");
    in.add("TE", "trailers");
    in.add("Upgrade", "h2c");
    in.add("Proxy-Authorization", "Basic x");
    in.add("Transfer-Encoding", "chunked");
    in.add("Cookie", "a=1");
    in.add("Cookie", "b=2");
    in.add("Accept", "text/html");
    in.add("Authorization", "Bearer t");

    HeaderSet out = ForwardRequestHeaders(in);
    assert(out.size() == 4);
    assert(!out.has("host"));
    assert(!out.has("content-length"));
    assert(!out.has("connection"));
    assert(!out.has("te"));
    assert(out.values("cookie").size() == 2);
    assert(out.value("accept") == "text/html");
    assert(out.value("authorization") == "Bearer t");
    // Order and spelling are preserved.
    assert(out.begin()->first == "Cookie");
    LOG_INFO << "ForwardRequestHeaders PASS";
}

void testFilterResponseHeaders() {
    HeaderSet in;
    in.add("Content-Type", "text/html");
    in.add("Content-Length", "100");
    in.add("Content-Encoding", "gzip");
    in.add("X-Frame-Options", "DENY");
    in.add("Content-Security-Policy", "frame-ancestors 'none'");
    in.add("Transfer-Encoding", "chunked");
    in.add("Set-Cookie", "a=1");
    in.add("Set-Cookie", "b=2");

    HeaderSet out = FilterResponseHeaders(in);
    assert(out.value("content-type") == "text/html");
    assert(!out.has("content-length"));
    assert(!out.has("content-encoding"));
    assert(!out.has("x-frame-options"));
    assert(!out.has("content-security-policy"));
    assert(!out.has("transfer-encoding"));
    assert(out.values("set-cookie").size() == 2);
    assert(out.value("X-Robots-Tag") == "noindex");

    // An upstream robots directive stays, noindex is added next to it.
    HeaderSet own;
    own.add("Content-Type", "application/json");
    own.add("x-robots-tag", "all");
    HeaderSet kept = FilterResponseHeaders(own);
    std::vector<std::string> robots = kept.values("X-Robots-Tag");
    assert(robots.size() == 2);
    assert(robots[0] == "all");
    assert(robots[1] == "noindex");

    // Already noindex: not repeated.
    HeaderSet already;
    already.add("X-Robots-Tag", "noindex, nofollow");
    assert(FilterResponseHeaders(already).values("X-Robots-Tag").size() == 1);
    LOG_INFO << "FilterResponseHeaders PASS";
}

void testRewriteLocation() {
    assert(RewriteLocation("/login", kMount) == kMount + "/login");
    assert(RewriteLocation(kMount + "/x", kMount) == kMount + "/x");
    assert(RewriteLocation("https://other/x", kMount) == "https://other/x");
    assert(RewriteLocation("relative/x", kMount) == "relative/x");
    assert(RewriteLocation("", kMount) == "");

    // Applying it twice changes nothing more.
    const std::string once = RewriteLocation("/a?b=1", kMount);
    assert(RewriteLocation(once, kMount) == once);
    LOG_INFO << "RewriteLocation PASS";
}

void testAppendVary() {
    HeaderSet h;
    AppendVary(&h, "Cookie");
    assert(h.value("Vary") == "Cookie");

    HeaderSet lower;
    lower.add("vary", "Accept-Encoding");
    AppendVary(&lower, "Cookie");
    assert(lower.size() == 1);
    assert(lower.begin()->first == "vary");
    assert(lower.begin()->second == "Accept-Encoding, Cookie");
    AppendVary(&lower, "Cookie");
    assert(lower.begin()->second == "Accept-Encoding, Cookie");

    HeaderSet present;
    present.add("Vary", "accept, cookie");
    AppendVary(&present, "Cookie");
    assert(present.value("Vary") == "accept, cookie");
    LOG_INFO << "AppendVary PASS";
}

void testWebSocketOrigin() {
    assert(ToWebSocketOrigin("https://up.example") == "wss://up.example");
    assert(ToWebSocketOrigin("http://up:2718/app") == "ws://up:2718/app");
    assert(ToWebSocketOrigin("ws://already") == "ws://already");
    assert(BuildUpstreamUrl(ToWebSocketOrigin("http://up/"), "ws", "session_id=1") == "ws://up/ws?session_id=1");
    LOG_INFO << "ToWebSocketOrigin PASS";
}

void testHopByHop() {
    assert(IsHopByHopHeader("Connection"));
    assert(IsHopByHopHeader("TRAILERS"));
    assert(IsHopByHopHeader("upgrade"));
    assert(!IsHopByHopHeader("Cookie"));
    assert(!IsHopByHopHeader("Content-Length"));
    LOG_INFO << "IsHopByHopHeader PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testBuildUpstreamUrl();
    testForwardRequestHeaders();
    testFilterResponseHeaders();
    testRewriteLocation();
    testAppendVary();
    testWebSocketOrigin();
    testHopByHop();
    return 0;
}
