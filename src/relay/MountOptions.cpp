#include "mountproxy/relay/MountOptions.h"
#include "mountproxy/protocol/HeaderSet.h"

#include <cstdlib>

namespace mountproxy {
namespace relay {

OriginProvider EnvOriginProvider(const std::string& envVar, const std::string& defaultOrigin) {
    return [envVar, defaultOrigin]() {
        const char* value = std::getenv(envVar.c_str());
        return protocol::HeaderSet::Trim(value ? std::string(value) : defaultOrigin);
    };
}

bool ValidateMountPath(const std::string& mount, std::string* error) {
    if (mount.empty()) {
        if (error) *error = "mount path is empty";
        return false;
    }
    if (mount[0] != '/') {
        if (error) *error = "mount path '" + mount + "' does not start with '/'";
        return false;
    }
    return true;
}

bool ValidateListenPort(int port, std::string* error) {
    if (port < 1 || port > 65535) {
        if (error) *error = "port " + std::to_string(port) + " is outside 1-65535";
        return false;
    }
    return true;
}

} // namespace relay
} // namespace mountproxy
