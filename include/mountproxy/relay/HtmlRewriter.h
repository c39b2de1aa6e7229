#pragma once

#include <optional>
#include <string>

namespace mountproxy {
namespace relay {

// Rewrites an upstream HTML document so it works under a mount prefix:
//   1. invalid UTF-8 is replaced with U+FFFD;
//   2. with a "dark" or "light" theme, the app's embedded theme settings are overridden;
//   3. <base href="{mount}/" /> goes after the first <head> unless a <base> exists;
//   4. root-relative href/src/action values get the mount prefix.
std::string RewriteHtml(const std::string& html, const std::string& mount,
                        const std::optional<std::string>& theme = std::nullopt);

// Only "dark" and "light" are honoured.
bool IsSupportedTheme(const std::optional<std::string>& theme);

// Value of the theme cookie when it is a supported theme.
std::optional<std::string> ThemeFromCookieHeader(const std::string& cookieHeader, const std::string& cookieName);

// Replaces invalid UTF-8 sequences with U+FFFD, one per maximal invalid subpart.
std::string SanitizeUtf8(const std::string& in);

// First window.__MARIMO_MOUNT_CONFIG__ = { ... }; block: its first "theme": "..." value.
std::string RewriteMountConfigTheme(const std::string& html, const std::string& theme);

// First <marimo-user-config data-config="..."> attribute: display.theme in the JSON payload.
std::string RewriteUserConfigTheme(const std::string& html, const std::string& theme);

std::string InjectBaseTag(const std::string& html, const std::string& mount);

std::string RewriteRootRelativeAttributes(const std::string& html, const std::string& mount);

} // namespace relay
} // namespace mountproxy
