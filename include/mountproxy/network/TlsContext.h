#pragma once

#include "mountproxy/common/noncopyable.h"

#include <memory>
#include <string>

struct ssl_ctx_st;

namespace mountproxy {
namespace network {

// Shared SSL_CTX for one direction: the listener (certificate and key) or
// outbound connections (trust store). Connections borrow ctx().
class TlsContext : mountproxy::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);
    // Empty caFile selects the system trust store.
    bool InitClient(const std::string& caFile = std::string());

    ssl_ctx_st* ctx() const { return ctx_.get(); }

private:
    struct Deleter {
        void operator()(ssl_ctx_st* ctx) const;
    };

    std::unique_ptr<ssl_ctx_st, Deleter> ctx_;
};

} // namespace network
} // namespace mountproxy
