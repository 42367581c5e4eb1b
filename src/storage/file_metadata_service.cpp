#include "puresend/storage/file_metadata_service.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"

namespace puresend::storage {

FileMetadataService::FileMetadataService(const StorageConfig& config)
    : chunk_manager_(config)
    , max_file_size_(config.max_file_size) {
}

core::Result FileMetadataService::prepare_transfer(const std::filesystem::path& path,
                                                   FileMetadata& metadata,
                                                   const std::atomic<bool>* cancel_flag) const {
    if (!core::utils::FileUtils::is_file(path)) {
        return core::Result(core::ErrorCode::IO_ERROR, "Not a readable regular file: " + path.string());
    }

    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot determine size of " + path.string());
    }

    if (*size > max_file_size_) {
        return core::Result(core::ErrorCode::TOO_LARGE,
                            path.filename().string() + " is " +
                            core::utils::StringUtils::format_bytes(*size) + ", limit is " +
                            core::utils::StringUtils::format_bytes(max_file_size_));
    }

    FileMetadata prepared;
    auto result = chunk_manager_.chunk_file(path, prepared, cancel_flag);
    if (!result) {
        LOG_WARN("Failed to prepare {}: {}", path.string(), result.message);
        return result;
    }

    LOG_INFO("Prepared {} ({} bytes, {} chunks, hash {})",
             prepared.name, prepared.size, prepared.chunk_count(), prepared.hash);
    metadata = std::move(prepared);
    return core::Result();
}

} // namespace puresend::storage
