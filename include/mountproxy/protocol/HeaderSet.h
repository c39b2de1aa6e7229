#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mountproxy {
namespace protocol {

// Ordered header list. Names match case-insensitively and are emitted with
// their original spelling; repeated names are kept as separate entries.
class HeaderSet {
public:
    using Entry = std::pair<std::string, std::string>;
    using List = std::vector<Entry>;
    using const_iterator = List::const_iterator;

    HeaderSet() = default;
    HeaderSet(std::initializer_list<Entry> init) : entries_(init) {}

    void add(const std::string& name, const std::string& value) { entries_.emplace_back(name, value); }

    // Replaces the first match in place and drops any later duplicates; appends when absent.
    void set(const std::string& name, const std::string& value);
    // Adds only when no entry with this name exists.
    void setDefault(const std::string& name, const std::string& value);
    // Returns the number of entries removed.
    size_t remove(const std::string& name);

    bool has(const std::string& name) const;
    std::optional<std::string> get(const std::string& name) const;
    // First value or empty string.
    std::string value(const std::string& name) const;
    std::vector<std::string> values(const std::string& name) const;

    // Index of the first match, or npos.
    size_t find(const std::string& name) const;
    Entry& at(size_t index) { return entries_[index]; }
    const Entry& at(size_t index) const { return entries_[index]; }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }
    void swap(HeaderSet& that) { entries_.swap(that.entries_); }

    static constexpr size_t npos = static_cast<size_t>(-1);

    static bool IEquals(const std::string& a, const std::string& b);
    static std::string ToLower(const std::string& s);
    static std::string Trim(const std::string& s);
    // Does a comma separated header value contain token (case-insensitive)?
    static bool ContainsToken(const std::string& headerValue, const std::string& token);

private:
    List entries_;
};

} // namespace protocol
} // namespace mountproxy
