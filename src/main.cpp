#include "mountproxy/MountProxyServer.h"
#include "mountproxy/network/EventLoop.h"
#include "mountproxy/network/InetAddress.h"
#include "mountproxy/network/TlsContext.h"
#include "mountproxy/relay/MountOptions.h"
#include "mountproxy/common/Logger.h"
#include "mountproxy/common/Config.h"

#include <getopt.h>
#include <unistd.h>
#include <cstdio>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    using namespace mountproxy;

    std::string configFile = "../config/mountproxy.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    if (!common::Config::Instance().Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }

    auto& conf = common::Config::Instance();
    common::Logger& logger = common::Logger::Instance();
    logger.SetLevel(common::Logger::ParseLevel(conf.GetString("global", "log_level", "INFO")));
    logger.SetColor(conf.GetBool("global", "log_color", ::isatty(STDOUT_FILENO) != 0));

    const int listenPort = conf.GetInt("global", "listen_port", 8080);
    const int threads = conf.GetInt("global", "threads", 4);
    const int reusePort = conf.GetInt("global", "reuse_port", 0);
    const int tlsEnable = conf.GetInt("tls", "enable", 0);
    const std::string tlsCertPath = conf.GetString("tls", "cert_path", "");
    const std::string tlsKeyPath = conf.GetString("tls", "key_path", "");

    relay::MountOptions options;
    options.mount = conf.GetString("mount", "path", relay::kDefaultMountPath);
    options.originEnv = conf.GetString("mount", "origin_env", relay::kDefaultOriginEnv);
    const std::string defaultOrigin = conf.GetString("mount", "default_origin", relay::kDefaultOrigin);
    options.origin = relay::EnvOriginProvider(options.originEnv, defaultOrigin);
    options.themeCookie = conf.GetString("mount", "theme_cookie", relay::kDefaultThemeCookie);
    options.upstreamTimeoutSec = conf.GetDouble("mount", "upstream_timeout_sec", relay::kDefaultUpstreamTimeoutSec);
    options.verifyPeer = conf.GetBool("upstream_tls", "verify_peer", true);
    const std::string caFile = conf.GetString("upstream_tls", "ca_file", "");

    std::string error;
    if (!relay::ValidateListenPort(listenPort, &error)) {
        LOG_ERROR << "Invalid [global] listen_port: " << error;
        return 1;
    }
    const uint16_t port = static_cast<uint16_t>(listenPort);
    if (!relay::ValidateMountPath(options.mount, &error)) {
        LOG_ERROR << "Invalid [mount] path: " << error;
        return 1;
    }
    if (options.themeCookie.empty()) {
        LOG_ERROR << "Invalid [mount] theme_cookie: empty";
        return 1;
    }
    if (options.upstreamTimeoutSec <= 0.0) {
        LOG_ERROR << "Invalid [mount] upstream_timeout_sec: " << options.upstreamTimeoutSec;
        return 1;
    }

    if (checkOnly) {
        // Exit code indicates success/failure for management scripts/CI.
        printf("OK\n");
        return 0;
    }

    auto upstreamTls = std::make_shared<network::TlsContext>();
    if (upstreamTls->InitClient(caFile)) {
        options.upstreamTls = upstreamTls;
    } else {
        LOG_WARN << "Upstream TLS context unavailable; https/wss origins will fail";
    }

    network::EventLoop loop;
    MountProxyServer server(&loop, network::InetAddress(port), options, "MountProxy",
                            reusePort != 0 ? network::TcpServer::kReusePort : network::TcpServer::kNoReusePort);
    if (!server.bound()) {
        LOG_ERROR << "Failed to bind port " << port;
        return 1;
    }
    server.SetThreadNum(threads);

    if (tlsEnable != 0) {
        if (tlsCertPath.empty() || tlsKeyPath.empty()) {
            LOG_ERROR << "TLS enabled but cert_path/key_path not set";
        } else if (!server.EnableTls(tlsCertPath, tlsKeyPath)) {
            LOG_ERROR << "TLS enable failed";
        } else {
            LOG_INFO << "TLS enabled (auto sniff): cert=" << tlsCertPath << " key=" << tlsKeyPath;
        }
    }

    LOG_INFO << "Mount " << options.mount << " origin from $" << options.originEnv
             << " (default " << defaultOrigin << "), upstream timeout " << options.upstreamTimeoutSec << "s";

    server.Start();

    loop.Loop();
    return 0;
}
