#include "puresend/storage/storage_config.hpp"
#include "puresend/core/config.hpp"

namespace puresend::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage;
    storage.receive_directory = config.get_string("receive.directory", "received");
    storage.database_path = config.get_string("resume.database", "puresend_resume.db");
    storage.chunk_size = static_cast<std::uint32_t>(
        config.get_uint64("transfer.chunk_size", storage.chunk_size));
    storage.max_file_size = config.get_uint64("transfer.max_file_size", storage.max_file_size);
    storage.resume_expiry = std::chrono::hours(config.get_int("resume.expiry_hours", 24));
    return storage;
}

bool StorageConfig::validate() const {
    if (receive_directory.empty() || database_path.empty()) {
        return false;
    }

    // 1KB to 64MB
    if (chunk_size < 1024 || chunk_size > 64 * 1024 * 1024) {
        return false;
    }

    if (max_file_size == 0) {
        return false;
    }

    return resume_expiry.count() > 0;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(receive_directory);

        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }

        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::uint64_t StorageConfig::get_available_space() const {
    std::error_code ec;
    auto space_info = std::filesystem::space(receive_directory, ec);
    return ec ? 0 : space_info.available;
}

bool StorageConfig::has_sufficient_space(std::uint64_t required_bytes) const {
    std::uint64_t available = get_available_space();

    // Keep at least 100MB free after the download
    std::uint64_t safety_margin = 100ULL * 1024 * 1024;

    return available > (required_bytes + safety_margin);
}

std::filesystem::path StorageConfig::get_partial_path(const std::filesystem::path& destination) {
    auto partial = destination;
    partial += PARTIAL_SUFFIX;
    return partial;
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    receive_directory = base_dir / "received";
    database_path = base_dir / "resume.db";
}

} // namespace puresend::storage
