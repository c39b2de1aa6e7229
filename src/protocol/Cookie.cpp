#include "mountproxy/protocol/Cookie.h"
#include "mountproxy/protocol/HeaderSet.h"

namespace mountproxy {
namespace protocol {

std::optional<std::string> GetCookieValue(const std::string& cookieHeader, const std::string& name) {
    if (name.empty() || cookieHeader.empty()) return std::nullopt;

    std::optional<std::string> found;
    size_t pos = 0;
    while (pos < cookieHeader.size()) {
        size_t next = cookieHeader.find(';', pos);
        if (next == std::string::npos) next = cookieHeader.size();

        const std::string part = HeaderSet::Trim(cookieHeader.substr(pos, next - pos));
        const size_t eq = part.find('=');
        if (eq != std::string::npos && HeaderSet::Trim(part.substr(0, eq)) == name) {
            std::string v = HeaderSet::Trim(part.substr(eq + 1));
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
                v = v.substr(1, v.size() - 2);
            }
            found = v;
        }

        pos = next + 1;
    }
    return found;
}

} // namespace protocol
} // namespace mountproxy
