#pragma once

#include <string>

namespace mountproxy {
namespace protocol {

// Escapes & < > and, when quote is set, " and ' for use in text and attribute values.
std::string HtmlEscape(const std::string& s, bool quote = true);

// Resolves character references: decimal and hex numeric ones plus the common
// named entities. Unknown or malformed references are left as they are.
std::string HtmlUnescape(const std::string& s);

// Appends the UTF-8 encoding of a code point; invalid ones become U+FFFD.
void AppendUtf8(std::string* out, unsigned long codePoint);

} // namespace protocol
} // namespace mountproxy
