#pragma once

#include "mountproxy/common/noncopyable.h"

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mountproxy {
namespace common {

// INI settings shared by the process. Keys that precede any [section]
// belong to "global". '#' and ';' start comment lines.
class Config : noncopyable {
public:
    static Config& Instance();

    // Replaces the current settings; on a parse error nothing changes.
    bool Load(const std::string& filename);
    bool LoadFromString(const std::string& iniText);
    void Clear();

    std::string GetString(const std::string& section, const std::string& key,
                          const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // 1/0, true/false, yes/no, on/off in any case.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    using Section = std::map<std::string, std::string>;
    using Settings = std::map<std::string, Section>;

    Config() = default;

    static bool parse(std::istream& in, const std::string& origin, Settings* out);
    std::optional<std::string> find(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    Settings settings_;
};

} // namespace common
} // namespace mountproxy
