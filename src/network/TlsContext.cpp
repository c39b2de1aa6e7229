#include "mountproxy/network/TlsContext.h"
#include "mountproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mountproxy {
namespace network {

namespace {

std::string LastSslError() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char text[256];
    ERR_error_string_n(code, text, sizeof text);
    ERR_clear_error();
    return text;
}

// The proxy speaks HTTP/1.1 only; steer ALPN clients away from h2.
int SelectHttp11(SSL*, const unsigned char** out, unsigned char* outlen,
                 const unsigned char* in, unsigned int inlen, void*) {
    static const unsigned char kHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outlen, kHttp11, sizeof kHttp11, in, inlen) != OPENSSL_NPN_NEGOTIATED) {
        return SSL_TLSEXT_ERR_NOACK;
    }
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

SSL_CTX* NewContext(const SSL_METHOD* method) {
    SSL_CTX* ctx = SSL_CTX_new(method);
    if (!ctx) {
        LOG_ERROR << "TlsContext: SSL_CTX_new failed: " << LastSslError();
        return nullptr;
    }
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
    return ctx;
}

} // namespace

void TlsContext::Deleter::operator()(ssl_ctx_st* ctx) const {
    SSL_CTX_free(ctx);
}

TlsContext::TlsContext() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

TlsContext::~TlsContext() = default;

bool TlsContext::InitServer(const std::string& certPemPath, const std::string& keyPemPath) {
    ctx_.reset();
    if (certPemPath.empty() || keyPemPath.empty()) {
        return false;
    }
    std::unique_ptr<ssl_ctx_st, Deleter> ctx(NewContext(TLS_server_method()));
    if (!ctx) {
        return false;
    }
    if (SSL_CTX_use_certificate_chain_file(ctx.get(), certPemPath.c_str()) != 1) {
        LOG_ERROR << "TlsContext: certificate " << certPemPath << ": " << LastSslError();
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), keyPemPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "TlsContext: private key " << keyPemPath << ": " << LastSslError();
        return false;
    }
    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        LOG_ERROR << "TlsContext: private key does not match " << certPemPath;
        return false;
    }
    SSL_CTX_set_alpn_select_cb(ctx.get(), SelectHttp11, nullptr);

    ctx_ = std::move(ctx);
    LOG_INFO << "TlsContext: serving certificate " << certPemPath;
    return true;
}

bool TlsContext::InitClient(const std::string& caFile) {
    ctx_.reset();
    std::unique_ptr<ssl_ctx_st, Deleter> ctx(NewContext(TLS_client_method()));
    if (!ctx) {
        return false;
    }
    const int loaded = caFile.empty() ? SSL_CTX_set_default_verify_paths(ctx.get())
                                      : SSL_CTX_load_verify_locations(ctx.get(), caFile.c_str(), nullptr);
    if (loaded != 1) {
        // Verification will fail per connection; the context itself is usable.
        LOG_WARN << "TlsContext: trust store " << (caFile.empty() ? "(system default)" : caFile)
                 << ": " << LastSslError();
    }
    ctx_ = std::move(ctx);
    return true;
}

} // namespace network
} // namespace mountproxy
