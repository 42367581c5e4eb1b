#pragma once

#include "error.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace puresend::core {

// Process-wide settings as dotted keys ("transfer.port").
//
// Files hold `key = value` lines. A `[section]` line prefixes the keys after it with
// "section.", so `[share]` followed by `port = 8080` sets "share.port". Lines starting
// with '#' or ';' are comments.
class Config {
public:
    static Config& instance();

    // NOT_FOUND when the file does not exist, INVALID_ARGUMENT naming the first bad line.
    // Values read before a bad line stay set.
    Result load_from_file(const std::filesystem::path& filename);
    // Writes one [section] block per key prefix.
    Result save_to_file(const std::filesystem::path& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return get(key).has_value(); }

    // true/yes/on/1 and false/no/off/0, case-insensitive; anything else yields the default.
    bool get_bool(const std::string& key, bool default_value = false) const;
    // The default also covers values with trailing junk or out of range.
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Ports fit in 16 bits, sizes and timeouts are positive numbers.
    Result validate() const;

    void set_defaults();
    void clear();

private:
    Config() = default;

    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;
};

} // namespace puresend::core
