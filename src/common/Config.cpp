#include "mountproxy/common/Config.h"
#include "mountproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mountproxy {
namespace common {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return std::string();
    }
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

// "a value" and 'a value' lose their quotes.
std::string Unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

bool Config::parse(std::istream& in, const std::string& origin, Settings* out) {
    std::string section = "global";
    std::string raw;
    for (int lineNo = 1; std::getline(in, raw); ++lineNo) {
        const std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            const std::string name = line.size() > 2 && line.back() == ']'
                ? Trim(line.substr(1, line.size() - 2)) : std::string();
            if (name.empty()) {
                LOG_ERROR << "Config: " << origin << ":" << lineNo << ": bad section header " << line;
                return false;
            }
            section = name;
            continue;
        }
        const size_t eq = line.find('=');
        const std::string key = eq == std::string::npos ? std::string() : Trim(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN << "Config: " << origin << ":" << lineNo << ": skipped " << line;
            continue;
        }
        (*out)[section][key] = Unquote(Trim(line.substr(eq + 1)));
    }
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        LOG_ERROR << "Config: cannot open " << filename;
        return false;
    }
    Settings parsed;
    if (!parse(file, filename, &parsed)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.swap(parsed);
    }
    LOG_INFO << "Config: loaded " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    Settings parsed;
    if (!parse(in, "<string>", &parsed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.swap(parsed);
    return true;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
}

std::optional<std::string> Config::find(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto sit = settings_.find(section);
    if (sit == settings_.end()) {
        return std::nullopt;
    }
    const auto kit = sit->second.find(key);
    if (kit == sit->second.end() || kit->second.empty()) {
        return std::nullopt;
    }
    return kit->second;
}

std::string Config::GetString(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    const auto value = find(section, key);
    return value ? *value : defaultVal;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    const auto value = find(section, key);
    if (!value) {
        return defaultVal;
    }
    char* end = nullptr;
    const long parsed = std::strtol(value->c_str(), &end, 10);
    if (end == value->c_str() || *end != '\0') {
        LOG_WARN << "Config: [" << section << "] " << key << " = " << *value << " is not an integer";
        return defaultVal;
    }
    return static_cast<int>(parsed);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    const auto value = find(section, key);
    if (!value) {
        return defaultVal;
    }
    char* end = nullptr;
    const double parsed = std::strtod(value->c_str(), &end);
    if (end == value->c_str() || *end != '\0') {
        LOG_WARN << "Config: [" << section << "] " << key << " = " << *value << " is not a number";
        return defaultVal;
    }
    return parsed;
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    const auto value = find(section, key);
    if (!value) {
        return defaultVal;
    }
    const std::string v = Lower(*value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    LOG_WARN << "Config: [" << section << "] " << key << " = " << *value << " is not a boolean";
    return defaultVal;
}

} // namespace common
} // namespace mountproxy
