#pragma once

#include <functional>
#include <memory>
#include <string>

namespace mountproxy {
namespace network {
class TlsContext;
} // namespace network

namespace relay {

constexpr const char* kDefaultMountPath = "/marimo/semantic-entropy-probe-comparison";
constexpr const char* kDefaultOriginEnv = "MARIMO_SEMANTIC_ENTROPY_BASE_URL";
constexpr const char* kDefaultOrigin = "http://semantic-entropy-probe-comparison.railway.internal";
constexpr const char* kDefaultThemeCookie = "theme";
constexpr double kDefaultUpstreamTimeoutSec = 30.0;

// Returns the upstream origin for the request being handled.
using OriginProvider = std::function<std::string()>;

// Reads envVar on every call; falls back to defaultOrigin when it is unset.
// Surrounding whitespace is trimmed either way.
OriginProvider EnvOriginProvider(const std::string& envVar, const std::string& defaultOrigin);

// Non-empty and starting with '/'.
bool ValidateMountPath(const std::string& mount, std::string* error);

// 1..65535.
bool ValidateListenPort(int port, std::string* error);

// Everything a relay needs to know about the mounted application.
struct MountOptions {
    std::string mount{kDefaultMountPath};
    OriginProvider origin;
    // Named on the degraded page so operators know what to set.
    std::string originEnv{kDefaultOriginEnv};
    std::string themeCookie{kDefaultThemeCookie};
    double upstreamTimeoutSec{kDefaultUpstreamTimeoutSec};

    // Client context for https/wss origins; null disables TLS upstreams.
    std::shared_ptr<network::TlsContext> upstreamTls;
    bool verifyPeer{true};
};

} // namespace relay
} // namespace mountproxy
