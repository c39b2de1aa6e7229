#include "mountproxy/relay/HtmlRewriter.h"
#include "mountproxy/protocol/Cookie.h"
#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/protocol/HtmlEscape.h"
#include "mountproxy/common/Logger.h"

#include <json/json.h>

#include <cctype>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <sstream>

namespace mountproxy {
namespace relay {

using protocol::HeaderSet;

namespace {

const char kMountConfigMarker[] = "window.__marimo_mount_config__";
const char kUserConfigTag[] = "<marimo-user-config";
const char kDataConfigAttr[] = "data-config=\"";

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

size_t SkipSpaces(const std::string& s, size_t pos) {
    while (pos < s.size() && IsSpace(s[pos])) ++pos;
    return pos;
}

// ASCII case-insensitive search; needle must be lower case.
size_t FindNoCase(const std::string& haystack, const char* needle, size_t from) {
    const size_t n = std::strlen(needle);
    if (n == 0) return from;
    for (size_t i = from; i + n <= haystack.size(); ++i) {
        size_t k = 0;
        while (k < n && std::tolower(static_cast<unsigned char>(haystack[i + k])) == needle[k]) ++k;
        if (k == n) return i;
    }
    return std::string::npos;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Length of the well-formed UTF-8 sequence at s[i], or of its longest valid
// prefix (negated) when it is malformed.
int Utf8SequenceLength(const std::string& s, size_t i) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    if (lead < 0x80) return 1;
    int need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return -1;
    }
    int consumed = 1;
    for (int k = 0; k < need; ++k) {
        const size_t j = i + 1 + static_cast<size_t>(k);
        if (j >= s.size()) return -consumed;
        const unsigned char c = static_cast<unsigned char>(s[j]);
        const unsigned char min = (k == 0) ? lo : 0x80;
        const unsigned char max = (k == 0) ? hi : 0xBF;
        if (c < min || c > max) return -consumed;
        ++consumed;
    }
    return consumed;
}

// Latin-1 punctuation and spaces, general punctuation, ideographic spaces and
// the BOM. Other non-ASCII code points are taken for letters or digits.
bool IsNonWordCodePoint(uint32_t cp) {
    if (cp <= 0xBF) {
        return !(cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA ||
                 (cp >= 0xBC && cp <= 0xBE));
    }
    return cp == 0xD7 || cp == 0xF7 || cp == 0x1680 || cp == 0xFEFF ||
           (cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x3000 && cp <= 0x3004);
}

// Whether the character ending right before pos is a word character.
bool WordCharBefore(const std::string& s, size_t pos) {
    if (pos == 0) return false;
    size_t start = pos - 1;
    while (start > 0 && pos - start < 4 && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) --start;
    const unsigned char lead = static_cast<unsigned char>(s[start]);
    if (lead < 0x80) {
        if (start != pos - 1) return true;
        return std::isalnum(lead) || lead == '_';
    }
    const size_t len = pos - start;
    if (Utf8SequenceLength(s, start) != static_cast<int>(len)) return true;
    uint32_t cp = lead & (0x7F >> len);
    for (size_t k = start + 1; k < pos; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[k]) & 0x3F);
    }
    return !IsNonWordCodePoint(cp);
}

// Matches '"theme"\s*:\s*"[^"]+"' starting at pos; sets the value span.
bool MatchThemeToken(const std::string& s, size_t pos, size_t* valueBegin, size_t* valueEnd) {
    static const char kKey[] = "\"theme\"";
    if (s.compare(pos, sizeof kKey - 1, kKey) != 0) return false;
    size_t p = SkipSpaces(s, pos + sizeof kKey - 1);
    if (p >= s.size() || s[p] != ':') return false;
    p = SkipSpaces(s, p + 1);
    if (p >= s.size() || s[p] != '"') return false;
    const size_t begin = p + 1;
    const size_t close = s.find('"', begin);
    if (close == std::string::npos || close == begin) return false;
    *valueBegin = begin;
    *valueEnd = close;
    return true;
}

// Bounds of the first mount-config block: [begin, end).
bool FindMountConfigBlock(const std::string& html, size_t* begin, size_t* end) {
    size_t from = 0;
    while (true) {
        const size_t at = FindNoCase(html, kMountConfigMarker, from);
        if (at == std::string::npos) return false;
        from = at + 1;

        size_t p = SkipSpaces(html, at + sizeof kMountConfigMarker - 1);
        if (p >= html.size() || html[p] != '=') continue;
        p = SkipSpaces(html, p + 1);
        if (p >= html.size() || html[p] != '{') continue;

        // The body ends at the first '}' followed by optional whitespace and ';'.
        for (size_t brace = html.find('}', p + 1); brace != std::string::npos; brace = html.find('}', brace + 1)) {
            const size_t semi = SkipSpaces(html, brace + 1);
            if (semi < html.size() && html[semi] == ';') {
                *begin = at;
                *end = semi + 1;
                return true;
            }
        }
        return false;
    }
}

// Bounds of the first user-config attribute value: [begin, end).
bool FindUserConfigValue(const std::string& html, size_t* begin, size_t* end) {
    const size_t attrLen = sizeof kDataConfigAttr - 1;
    size_t from = 0;
    while (true) {
        const size_t tag = FindNoCase(html, kUserConfigTag, from);
        if (tag == std::string::npos) return false;
        from = tag + 1;

        const size_t nameEnd = tag + sizeof kUserConfigTag - 1;
        size_t tagEnd = html.find('>', nameEnd);
        if (tagEnd == std::string::npos) tagEnd = html.size();

        // The last data-config=" inside the tag wins; its value may run past the '>'.
        size_t best = std::string::npos;
        for (size_t a = FindNoCase(html, kDataConfigAttr, nameEnd);
             a != std::string::npos && a + attrLen <= tagEnd;
             a = FindNoCase(html, kDataConfigAttr, a + 1)) {
            if (!WordCharBefore(html, a)) best = a;
        }
        while (best != std::string::npos) {
            const size_t valueBegin = best + attrLen;
            const size_t quote = html.find('"', valueBegin);
            if (quote != std::string::npos) {
                *begin = valueBegin;
                *end = quote;
                return true;
            }
            // Unterminated value: fall back to an earlier attribute, if any.
            size_t prev = std::string::npos;
            for (size_t a = FindNoCase(html, kDataConfigAttr, nameEnd);
                 a != std::string::npos && a < best;
                 a = FindNoCase(html, kDataConfigAttr, a + 1)) {
                if (!WordCharBefore(html, a)) prev = a;
            }
            best = prev;
        }
    }
}

// Returns false when the payload is not a JSON object or cannot be handled.
bool SetDisplayTheme(const std::string& rawJson, const std::string& theme, std::string* out) {
    Json::CharReaderBuilder rb;
    rb["collectComments"] = false;
    rb["allowComments"] = false;
    rb["allowTrailingCommas"] = false;
    rb["allowSingleQuotes"] = false;
    rb["failIfExtra"] = true;
    rb["rejectDupKeys"] = false;
    rb["allowSpecialFloats"] = true;
    std::unique_ptr<Json::CharReader> reader(rb.newCharReader());

    Json::Value cfg;
    std::string errs;
    if (!reader->parse(rawJson.data(), rawJson.data() + rawJson.size(), &cfg, &errs)) {
        LOG_DEBUG << "HtmlRewriter: user config is not valid JSON: " << errs;
        return false;
    }
    if (!cfg.isObject()) {
        return false;
    }
    if (!cfg["display"].isObject()) {
        cfg["display"] = Json::Value(Json::objectValue);
    }
    cfg["display"]["theme"] = theme;

    Json::StreamWriterBuilder wb;
    wb["indentation"] = "";
    wb["commentStyle"] = "None";
    wb["emitUTF8"] = true;
    wb["useSpecialFloats"] = true;
    // Decimals as typed (0.1, 2.5) come back unchanged. Integers wider than
    // 64 bits were parsed as doubles and keep 15 significant digits.
    wb["precision"] = 15;
    wb["precisionType"] = "significant";
    *out = Json::writeString(wb, cfg);
    return true;
}

} // namespace

bool IsSupportedTheme(const std::optional<std::string>& theme) {
    return theme && (*theme == "dark" || *theme == "light");
}

std::optional<std::string> ThemeFromCookieHeader(const std::string& cookieHeader, const std::string& cookieName) {
    std::optional<std::string> value = protocol::GetCookieValue(cookieHeader, cookieName);
    if (!IsSupportedTheme(value)) return std::nullopt;
    return value;
}

std::string SanitizeUtf8(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        const int n = Utf8SequenceLength(in, i);
        if (n > 0) {
            out.append(in, i, static_cast<size_t>(n));
            i += static_cast<size_t>(n);
        } else {
            out += "\xEF\xBF\xBD";
            i += static_cast<size_t>(-n);
        }
    }
    return out;
}

std::string RewriteMountConfigTheme(const std::string& html, const std::string& theme) {
    size_t begin = 0, end = 0;
    if (!FindMountConfigBlock(html, &begin, &end)) return html;

    for (size_t key = html.find("\"theme\"", begin); key != std::string::npos && key < end;
         key = html.find("\"theme\"", key + 1)) {
        size_t valueBegin = 0, valueEnd = 0;
        if (MatchThemeToken(html, key, &valueBegin, &valueEnd) && valueEnd < end) {
            return html.substr(0, valueBegin) + theme + html.substr(valueEnd);
        }
    }
    return html;
}

std::string RewriteUserConfigTheme(const std::string& html, const std::string& theme) {
    size_t begin = 0, end = 0;
    if (!FindUserConfigValue(html, &begin, &end)) return html;

    std::string json;
    try {
        if (!SetDisplayTheme(protocol::HtmlUnescape(html.substr(begin, end - begin)), theme, &json)) {
            return html;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG << "HtmlRewriter: user config left unchanged: " << e.what();
        return html;
    }
    return html.substr(0, begin) + protocol::HtmlEscape(json, true) + html.substr(end);
}

std::string InjectBaseTag(const std::string& html, const std::string& mount) {
    if (FindNoCase(html, "<base", 0) != std::string::npos) return html;

    size_t end = std::string::npos;
    for (size_t at = FindNoCase(html, "<head", 0); at != std::string::npos; at = FindNoCase(html, "<head", at + 1)) {
        const size_t next = at + 5;
        if (next >= html.size()) break;
        if (html[next] == '>') {
            end = next + 1;
            break;
        }
        if (IsSpace(html[next])) {
            const size_t gt = html.find('>', next);
            if (gt == std::string::npos) break;
            end = gt + 1;
            break;
        }
    }
    if (end == std::string::npos) return html;

    std::string base = mount;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return html.substr(0, end) + "\n<base href=\"" + base + "/\" />" + html.substr(end);
}

std::string RewriteRootRelativeAttributes(const std::string& html, const std::string& mount) {
    std::string baseHref = mount;
    while (!baseHref.empty() && baseHref.back() == '/') baseHref.pop_back();
    baseHref += '/';
    size_t skip = 0;
    while (skip < mount.size() && mount[skip] == '/') ++skip;
    const std::string mountPrefix = mount.substr(skip);

    static const char* const kAttrs[] = {"href", "src", "action"};

    std::string out;
    out.reserve(html.size() + html.size() / 16);
    size_t i = 0;
    while (i < html.size()) {
        bool rewritten = false;
        if (!WordCharBefore(html, i)) {
            for (const char* attr : kAttrs) {
                const size_t n = std::strlen(attr);
                if (html.compare(i, n, attr) != 0) continue;
                size_t p = i + n;
                if (p + 2 > html.size() || html[p] != '=' || (html[p + 1] != '"' && html[p + 1] != '\'')) break;
                p += 2;
                if (p >= html.size() || html[p] != '/') break;
                if (p + 1 < html.size() && html[p + 1] == '/') break;

                const size_t restBegin = p + 1;
                size_t restEnd = html.find_first_of("\"'", restBegin);
                if (restEnd == std::string::npos) restEnd = html.size();
                const std::string rest = html.substr(restBegin, restEnd - restBegin);

                if (rest == mountPrefix || StartsWith(rest, mountPrefix + "/")) {
                    out.append(html, i, restEnd - i);
                } else {
                    out.append(html, i, p - i);
                    out += baseHref;
                    out += rest;
                }
                i = restEnd;
                rewritten = true;
                break;
            }
        }
        if (!rewritten) {
            out.push_back(html[i]);
            ++i;
        }
    }
    return out;
}

std::string RewriteHtml(const std::string& html, const std::string& mount,
                        const std::optional<std::string>& theme) {
    std::string doc = SanitizeUtf8(html);
    if (IsSupportedTheme(theme)) {
        doc = RewriteMountConfigTheme(doc, *theme);
        doc = RewriteUserConfigTheme(doc, *theme);
    }
    doc = InjectBaseTag(doc, mount);
    return RewriteRootRelativeAttributes(doc, mount);
}

} // namespace relay
} // namespace mountproxy
