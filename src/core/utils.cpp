#include "puresend/core/utils.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <ctime>
#include <cctype>

namespace puresend::core::utils {

namespace {
    const std::vector<std::string> COMPOUND_EXTENSIONS = {
        ".tar.gz", ".tar.bz2", ".tar.xz", ".tar.zst", ".tar.lz"
    };
}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::size_t start = 0;
    while (start <= str.size()) {
        auto end = str.find(delimiter, start);
        if (end == std::string::npos) {
            end = str.size();
        }
        if (end > start) {
            result.push_back(str.substr(start, end - start));
        }
        start = end + 1;
    }
    return result;
}

std::string StringUtils::trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(str.begin(), str.end(), is_space);
    auto last = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }

    if (unit == 0) {
        return std::to_string(bytes) + " B";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();

    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto minutes = seconds / 60;
    seconds %= 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::string StringUtils::percent_encode(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<unsigned>(c);
        }
    }

    return oss.str();
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::pair<std::string, std::string> FileUtils::split_extension(const std::string& filename) {
    auto lower = StringUtils::to_lower(filename);
    for (const auto& compound : COMPOUND_EXTENSIONS) {
        if (lower.size() > compound.size() && lower.ends_with(compound)) {
            auto stem_length = filename.size() - compound.size();
            return {filename.substr(0, stem_length), filename.substr(stem_length)};
        }
    }

    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

std::filesystem::path FileUtils::unique_path(const std::filesystem::path& desired) {
    if (!exists(desired)) {
        return desired;
    }

    auto [stem, extension] = split_extension(desired.filename().string());
    auto parent = desired.parent_path();

    for (int counter = 1;; ++counter) {
        auto candidate = parent / (stem + " (" + std::to_string(counter) + ")" + extension);
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

std::string FileUtils::sanitize_filename(const std::string& name) {
    auto base = std::filesystem::path(name).filename().string();
    auto slash = base.find_last_of("\\/");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string result;
    result.reserve(base.size());
    for (char c : base) {
        if (static_cast<unsigned char>(c) < 0x20 || c == ':' || c == '*' || c == '?' ||
            c == '"' || c == '<' || c == '>' || c == '|') {
            result.push_back('_');
        } else {
            result.push_back(c);
        }
    }

    if (result.empty() || result == "." || result == "..") {
        return "unnamed";
    }
    return result;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

std::int64_t TimeUtils::to_unix_millis(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_millis(std::int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace puresend::core::utils
