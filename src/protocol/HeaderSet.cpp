#include "mountproxy/protocol/HeaderSet.h"

#include <algorithm>
#include <cctype>

namespace mountproxy {
namespace protocol {

bool HeaderSet::IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string HeaderSet::ToLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string HeaderSet::Trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

bool HeaderSet::ContainsToken(const std::string& headerValue, const std::string& token) {
    size_t pos = 0;
    while (pos <= headerValue.size()) {
        size_t comma = headerValue.find(',', pos);
        if (comma == std::string::npos) comma = headerValue.size();
        if (IEquals(Trim(headerValue.substr(pos, comma - pos)), token)) return true;
        pos = comma + 1;
    }
    return false;
}

size_t HeaderSet::find(const std::string& name) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (IEquals(entries_[i].first, name)) return i;
    }
    return npos;
}

void HeaderSet::set(const std::string& name, const std::string& value) {
    const size_t idx = find(name);
    if (idx == npos) {
        add(name, value);
        return;
    }
    entries_[idx].second = value;
    for (size_t i = entries_.size(); i-- > idx + 1;) {
        if (IEquals(entries_[i].first, name)) entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
    }
}

void HeaderSet::setDefault(const std::string& name, const std::string& value) {
    if (!has(name)) add(name, value);
}

size_t HeaderSet::remove(const std::string& name) {
    const size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&name](const Entry& e) { return IEquals(e.first, name); }),
                   entries_.end());
    return before - entries_.size();
}

bool HeaderSet::has(const std::string& name) const {
    return find(name) != npos;
}

std::optional<std::string> HeaderSet::get(const std::string& name) const {
    const size_t idx = find(name);
    if (idx == npos) return std::nullopt;
    return entries_[idx].second;
}

std::string HeaderSet::value(const std::string& name) const {
    const size_t idx = find(name);
    return idx == npos ? std::string() : entries_[idx].second;
}

std::vector<std::string> HeaderSet::values(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& e : entries_) {
        if (IEquals(e.first, name)) out.push_back(e.second);
    }
    return out;
}

} // namespace protocol
} // namespace mountproxy
