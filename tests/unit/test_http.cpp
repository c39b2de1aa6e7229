#include "mountproxy/protocol/HttpContext.h"
#include "mountproxy/protocol/HttpResponse.h"
#include "mountproxy/protocol/HttpResponseContext.h"
#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/network/Buffer.h"
#include "mountproxy/common/Logger.h"
#include <iostream>
#include <cassert>

using namespace mountproxy::protocol;
using namespace mountproxy::network;
using namespace mountproxy::common;

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    std::string inputPart1 = "GET /index.html?id=123 HTTP/1.1\r\nHost: ";
    std::string inputPart2 = "localhost\r\nUser-Agent: curl/7.68.0\r\nCookie: a=1\r\nCookie: theme=dark\r\n\r\n";

    buf.Append(inputPart1);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append(inputPart2);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.method() == "GET");
    assert(req.path() == "/index.html");
    assert(req.query() == "id=123");
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("User-Agent") == "curl/7.68.0");
    assert(req.headers().values("cookie").size() == 2);
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Request PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    std::string input =
        "POST /submit HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello"
        "GET /next HTTP/1.1\r\n\r\n";
    buf.Append(input);
    bool ok = context.parseRequest(&buf, std::chrono::system_clock::now());
    assert(ok);
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.method() == "POST");
    assert(req.path() == "/submit");
    assert(req.query().empty());
    assert(req.body() == "hello");

    // The pipelined request stays in the buffer for the next round.
    context.reset();
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().path() == "/next");
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    std::string input =
        "PATCH /chunk HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\n"
        "hello\r\n"
        "6;ext=1\r\n"
        " world\r\n"
        "0\r\n"
        "X-Trailer: yes\r\n"
        "\r\n";
    buf.Append(input);
    bool ok = context.parseRequest(&buf, std::chrono::system_clock::now());
    assert(ok);
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.method() == "PATCH");
    assert(req.path() == "/chunk");
    assert(req.body() == "hello world");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Chunked Body PASS";
}

void testRejectMalformedRequests() {
    const char* bad[] = {
        "GET /x HTTP/2.0\r\n\r\n",
        "G(T /x HTTP/1.1\r\n\r\n",
        "GET /x HTTP/1.1\r\nno colon here\r\n\r\n",
        "POST /x HTTP/1.1\r\nContent-Length: abc\r\n\r\n",
        "POST /x HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n",
    };
    for (const char* raw : bad) {
        HttpContext context;
        Buffer buf;
        buf.Append(std::string(raw));
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }

    // A head that never ends is cut off.
    HttpContext context;
    Buffer buf;
    buf.Append("GET /x HTTP/1.1\r\nX-Long: " + std::string(HttpContext::kMaxHeaderBytes, 'a'));
    assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    LOG_INFO << "Reject Malformed Requests PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.addHeader("Server", "mountproxy");
    resp.addHeader("Content-Length", "999");
    resp.addHeader("Set-Cookie", "a=1");
    resp.addHeader("Set-Cookie", "b=2");
    resp.setBody("Hello World");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string output = buf.RetrieveAllAsString();
    assert(output ==
           "HTTP/1.1 200 OK\r\n"
           "Content-Type: text/plain\r\n"
           "Server: mountproxy\r\n"
           "Set-Cookie: a=1\r\n"
           "Set-Cookie: b=2\r\n"
           "Content-Length: 11\r\n"
           "Connection: close\r\n"
           "\r\n"
           "Hello World");

    HttpResponse head;
    head.setStatusCode(HttpResponse::k502BadGateway);
    head.setHeadRequest(true);
    head.setBody("page");
    Buffer hb;
    head.appendToBuffer(&hb);
    const std::string headOut = hb.RetrieveAllAsString();
    assert(headOut.find("HTTP/1.1 502 Bad Gateway\r\n") == 0);
    assert(headOut.find("Content-Length: 4\r\n") != std::string::npos);
    assert(headOut.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(headOut.substr(headOut.size() - 4) == "\r\n\r\n");

    HttpResponse notModified;
    notModified.setStatusCode(HttpResponse::k304NotModified);
    Buffer nb;
    notModified.appendToBuffer(&nb);
    assert(nb.RetrieveAllAsString().find("Content-Length") == std::string::npos);
    LOG_INFO << "Response Gen PASS";
}

void testParseResponse() {
    HttpResponseContext ctx;
    Buffer buf;
    buf.Append("HTTP/1.1 100 Continue\r\n\r\n"
               "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\nContent-Len");
    assert(ctx.parseResponse(&buf));
    assert(!ctx.gotAll());
    buf.Append("gth: 4\r\n\r\nbo");
    assert(ctx.parseResponse(&buf));
    assert(!ctx.gotAll());
    buf.Append("dy");
    assert(ctx.parseResponse(&buf));
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 200);
    assert(ctx.reasonPhrase() == "OK");
    assert(ctx.headers().value("content-type") == "text/html");
    assert(ctx.body() == "body");
    assert(ctx.keepAlive());

    HttpResponseContext chunked;
    Buffer cb;
    cb.Append("HTTP/1.1 404 Not Found\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
              "3\r\nabc\r\n0\r\nX-T: 1\r\n\r\n");
    assert(chunked.parseResponse(&cb));
    assert(chunked.gotAll());
    assert(chunked.statusCode() == 404);
    assert(chunked.body() == "abc");
    assert(!chunked.keepAlive());

    HttpResponseContext untilClose;
    Buffer ub;
    ub.Append("HTTP/1.0 200 OK\r\n\r\npartial");
    assert(untilClose.parseResponse(&ub));
    assert(!untilClose.gotAll());
    ub.Append(" body");
    assert(untilClose.parseResponse(&ub));
    assert(untilClose.finishOnClose());
    assert(untilClose.body() == "partial body");

    HttpResponseContext cut;
    Buffer tb;
    tb.Append("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
    assert(cut.parseResponse(&tb));
    assert(!cut.finishOnClose());
    assert(cut.hasError());

    HttpResponseContext head;
    head.setRequestMethod("HEAD");
    Buffer hb;
    hb.Append("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n");
    assert(head.parseResponse(&hb));
    assert(head.gotAll());
    assert(head.body().empty());

    HttpResponseContext garbage;
    Buffer gb;
    gb.Append("SSH-2.0-OpenSSH\r\n");
    assert(!garbage.parseResponse(&gb));
    assert(!garbage.error().empty());
    LOG_INFO << "Parse Response PASS";
}

void testHeaderSet() {
    HeaderSet h{{"Accept", "a"}, {"accept", "b"}, {"Host", "h"}};
    assert(h.size() == 3);
    assert(h.value("ACCEPT") == "a");
    assert(h.values("accept").size() == 2);
    h.set("Accept", "c");
    assert(h.values("accept").size() == 1);
    assert(h.value("accept") == "c");
    assert(h.begin()->first == "Accept");
    h.setDefault("host", "other");
    assert(h.value("Host") == "h");
    assert(h.remove("HOST") == 1);
    assert(!h.get("Host"));
    assert(h.value("missing").empty());

    assert(HeaderSet::ContainsToken("keep-alive, Upgrade", "upgrade"));
    assert(!HeaderSet::ContainsToken("upgraded", "upgrade"));
    assert(HeaderSet::Trim("  x y \t") == "x y");
    LOG_INFO << "HeaderSet PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testParseContentLengthBody();
    testParseChunkedBody();
    testRejectMalformedRequests();
    testResponseGen();
    testParseResponse();
    testHeaderSet();
    return 0;
}
