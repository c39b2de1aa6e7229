#pragma once

#include <optional>
#include <string>

namespace mountproxy {
namespace protocol {

// Parse a Cookie header value and return the value of a cookie by name.
// Example: "a=1; b=2" + "b" => "2". A repeated name resolves to the last occurrence.
// Returns nullopt if not found; surrounding double quotes are stripped.
std::optional<std::string> GetCookieValue(const std::string& cookieHeader, const std::string& name);

} // namespace protocol
} // namespace mountproxy
