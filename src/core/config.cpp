#include "puresend/core/config.hpp"
#include "puresend/core/logger.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace puresend::core {

namespace {

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

bool valid_key(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

template<typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

constexpr const char* PORT_KEYS[] = {
    "transfer.port", "discovery.port", "share.port", "web_upload.port"
};

constexpr const char* POSITIVE_KEYS[] = {
    "transfer.chunk_size", "transfer.max_file_size", "transfer.offer_timeout_seconds",
    "transfer.io_timeout_seconds", "discovery.announce_interval_ms", "discovery.peer_timeout_ms",
    "discovery.probe_timeout_ms", "share.max_files", "share.max_total_size",
    "share.pin_max_attempts", "share.pin_lock_seconds", "resume.expiry_hours"
};

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result Config::load_from_file(const std::filesystem::path& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(filename, ec)) {
            return Result(ErrorCode::NOT_FOUND, "No config file at " + filename.string());
        }
        return Result(ErrorCode::IO_ERROR, "Cannot read " + filename.string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string section;
    std::string line;
    for (int line_number = 1; std::getline(file, line); ++line_number) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        auto where = [&]() { return filename.string() + ":" + std::to_string(line_number); };

        if (line.front() == '[') {
            if (line.back() != ']' || !valid_key(trim(line.substr(1, line.size() - 2)))) {
                return Result(ErrorCode::INVALID_ARGUMENT, where() + ": malformed section " + line);
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return Result(ErrorCode::INVALID_ARGUMENT, where() + ": expected key = value");
        }

        auto key = trim(line.substr(0, eq));
        if (!valid_key(key)) {
            return Result(ErrorCode::INVALID_ARGUMENT, where() + ": invalid key '" + key + "'");
        }
        values_[section.empty() ? key : section + "." + key] = trim(line.substr(eq + 1));
    }

    LOG_DEBUG("Loaded configuration from {}", filename.string());
    return Result();
}

Result Config::save_to_file(const std::filesystem::path& filename) const {
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_ERROR, "Cannot write " + filename.string());
    }

    file << "# PureSend configuration\n";

    std::lock_guard<std::mutex> lock(mutex_);
    // Keys without a section must precede the first [section] line.
    for (const auto& [key, value] : values_) {
        if (key.find('.') == std::string::npos) {
            file << key << " = " << value << "\n";
        }
    }

    std::string section;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            continue;
        }
        if (key.compare(0, dot, section) != 0 || section.size() != dot) {
            section = key.substr(0, dot);
            file << "\n[" << section << "]\n";
        }
        file << key.substr(dot + 1) << " = " << value << "\n";
    }

    if (!file) {
        return Result(ErrorCode::IO_ERROR, "Failed writing " + filename.string());
    }
    return Result();
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    auto number = value ? parse_number<int>(*value) : std::nullopt;
    return number.value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    auto number = value ? parse_number<std::uint64_t>(*value) : std::nullopt;
    return number.value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

Result Config::validate() const {
    for (const char* key : PORT_KEYS) {
        auto value = get(key);
        if (value && !parse_number<std::uint16_t>(*value)) {
            return Result(ErrorCode::INVALID_ARGUMENT, std::string(key) + " is not a port: " + *value);
        }
    }

    for (const char* key : POSITIVE_KEYS) {
        auto value = get(key);
        if (!value) {
            continue;
        }
        auto number = parse_number<std::uint64_t>(*value);
        if (!number || *number == 0) {
            return Result(ErrorCode::INVALID_ARGUMENT, std::string(key) + " must be a positive number: " + *value);
        }
    }

    auto mode = get("transfer.compression_mode");
    if (mode) {
        std::string lower = *mode;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower != "smart" && lower != "manual") {
            return Result(ErrorCode::INVALID_ARGUMENT, "transfer.compression_mode must be smart or manual: " + *mode);
        }
    }

    auto deflate_level = get("transfer.compression_level");
    if (deflate_level) {
        auto number = parse_number<int>(*deflate_level);
        if (!number || *number < 1 || *number > 9) {
            return Result(ErrorCode::INVALID_ARGUMENT,
                          "transfer.compression_level must be between 1 and 9: " + *deflate_level);
        }
    }

    // An unknown name falls back to whichever default it is given.
    auto level = get("log.level");
    if (level && Logger::parse_level(*level, LogLevel::Trace) != Logger::parse_level(*level, LogLevel::Off)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Unknown log.level: " + *level);
    }
    return Result();
}

void Config::set_defaults() {
    std::string host = "puresend";
    boost::system::error_code ec;
    auto name = boost::asio::ip::host_name(ec);
    if (!ec && !name.empty()) {
        host = name;
    }

    auto receive_dir = (std::filesystem::temp_directory_path() / "puresend" / "received").string();
    if (const char* home = std::getenv("HOME")) {
        receive_dir = (std::filesystem::path(home) / "Downloads" / "PureSend").string();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_["node.name"] = host;
    values_["node.device_type"] = "desktop";

    values_["transfer.port"] = "0";
    values_["transfer.chunk_size"] = "1048576";
    values_["transfer.max_file_size"] = "68719476736";
    values_["transfer.encryption"] = "false";
    values_["transfer.compression"] = "true";
    values_["transfer.compression_mode"] = "smart";
    values_["transfer.compression_level"] = "6";
    values_["transfer.offer_timeout_seconds"] = "60";
    values_["transfer.io_timeout_seconds"] = "30";

    values_["receive.directory"] = receive_dir;
    values_["receive.auto_accept"] = "true";
    values_["receive.overwrite"] = "false";

    values_["discovery.enabled"] = "true";
    values_["discovery.port"] = "5353";
    values_["discovery.announce_interval_ms"] = "3000";
    values_["discovery.peer_timeout_ms"] = "10000";
    values_["discovery.probe_timeout_ms"] = "2000";

    values_["share.port"] = "0";
    values_["share.max_files"] = "1000";
    values_["share.max_total_size"] = "274877906944";
    values_["share.pin_max_attempts"] = "3";
    values_["share.pin_lock_seconds"] = "300";

    values_["web_upload.port"] = "0";

    values_["resume.database"] = "puresend_resume.db";
    values_["resume.expiry_hours"] = "24";

    values_["log.level"] = "info";
    values_["log.file"] = "puresend.log";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

} // namespace puresend::core
