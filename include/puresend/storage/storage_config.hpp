#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <cstdint>

namespace puresend::core {
class Config;
}

namespace puresend::storage {

struct StorageConfig {
    static constexpr const char* PARTIAL_SUFFIX = ".pspart";

    std::filesystem::path receive_directory;
    std::filesystem::path database_path;

    std::uint32_t chunk_size = 1024 * 1024; // 1MB
    std::uint64_t max_file_size = 64ULL * 1024 * 1024 * 1024; // 64GB
    std::chrono::hours resume_expiry{24};

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& base_dir);

    static StorageConfig from_config(const core::Config& config);

    bool validate() const;

    bool create_directories() const;

    std::uint64_t get_available_space() const;

    bool has_sufficient_space(std::uint64_t required_bytes) const;

    // In-progress receive target living next to its final destination.
    static std::filesystem::path get_partial_path(const std::filesystem::path& destination);

    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace puresend::storage
