#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <optional>
#include <utility>
#include <cstdint>

namespace puresend::core::utils {

class StringUtils {
public:
    // Empty fields are dropped: "a,,b" gives {"a", "b"}.
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // RFC 3986 percent-encoding, keeps unreserved characters only.
    static std::string percent_encode(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();

    // Splits "archive.tar.gz" into {"archive", ".tar.gz"} and "photo.jpg" into {"photo", ".jpg"}.
    static std::pair<std::string, std::string> split_extension(const std::string& filename);

    // First free path of the form "name.ext", "name (1).ext", "name (2).ext", ...
    static std::filesystem::path unique_path(const std::filesystem::path& desired);

    // Strips directory components and characters that are unsafe in a file name.
    static std::string sanitize_filename(const std::string& name);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::int64_t to_unix_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);
    // UTC, second precision: "2024-05-01T12:00:00Z".
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

} // namespace puresend::core::utils
