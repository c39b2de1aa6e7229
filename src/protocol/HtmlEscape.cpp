#include "mountproxy/protocol/HtmlEscape.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace mountproxy {
namespace protocol {

namespace {

struct NamedEntity {
    const char* name;
    unsigned long codePoint;
};

const NamedEntity kNamedEntities[] = {
    {"amp", '&'},     {"lt", '<'},      {"gt", '>'},       {"quot", '"'},
    {"apos", '\''},   {"nbsp", 0xA0},   {"copy", 0xA9},    {"reg", 0xAE},
    {"hellip", 0x2026}, {"mdash", 0x2014}, {"ndash", 0x2013}, {"laquo", 0xAB},
    {"raquo", 0xBB},  {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C},
    {"rdquo", 0x201D}, {"middot", 0xB7}, {"times", 0xD7},  {"deg", 0xB0},
};

// These four are also recognised without the trailing ';'.
bool IsLegacyName(const std::string& name) {
    return name == "amp" || name == "lt" || name == "gt" || name == "quot";
}

} // namespace

void AppendUtf8(std::string* out, unsigned long cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        out->push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string HtmlEscape(const std::string& s, bool quote) {
    std::string out;
    out.reserve(s.size() + s.size() / 8);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (quote) out += "&quot;"; else out.push_back(c);
                break;
            case '\'':
                if (quote) out += "&#x27;"; else out.push_back(c);
                break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string HtmlUnescape(const std::string& s) {
    if (s.find('&') == std::string::npos) return s;

    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            out.push_back(s[i++]);
            continue;
        }

        if (i + 1 < s.size() && s[i + 1] == '#') {
            size_t j = i + 2;
            const bool hex = j < s.size() && (s[j] == 'x' || s[j] == 'X');
            if (hex) ++j;
            const size_t digitsStart = j;
            while (j < s.size() && (hex ? std::isxdigit(static_cast<unsigned char>(s[j]))
                                        : std::isdigit(static_cast<unsigned char>(s[j])))) {
                ++j;
            }
            if (j == digitsStart || j - digitsStart > 8) {
                out.push_back(s[i++]);
                continue;
            }
            const unsigned long cp = std::strtoul(s.substr(digitsStart, j - digitsStart).c_str(), nullptr, hex ? 16 : 10);
            AppendUtf8(&out, cp);
            if (j < s.size() && s[j] == ';') ++j;
            i = j;
            continue;
        }

        size_t j = i + 1;
        while (j < s.size() && std::isalnum(static_cast<unsigned char>(s[j])) && j - i <= 32) ++j;
        const std::string name = s.substr(i + 1, j - i - 1);
        const bool terminated = j < s.size() && s[j] == ';';
        bool matched = false;
        if (!name.empty() && (terminated || IsLegacyName(name))) {
            for (const auto& e : kNamedEntities) {
                if (name == e.name) {
                    AppendUtf8(&out, e.codePoint);
                    i = terminated ? j + 1 : j;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            out.push_back(s[i++]);
        }
    }
    return out;
}

} // namespace protocol
} // namespace mountproxy
