#pragma once

#include "chunk_manager.hpp"
#include "file_metadata.hpp"
#include "storage_config.hpp"
#include "../core/error.hpp"
#include <atomic>
#include <filesystem>

namespace puresend::storage {

// Computes the identity of a file about to be sent or shared.
class FileMetadataService {
public:
    explicit FileMetadataService(const StorageConfig& config);

    // IO_ERROR when the path is not a readable regular file, TOO_LARGE above max_file_size.
    core::Result prepare_transfer(const std::filesystem::path& path,
                                  FileMetadata& metadata,
                                  const std::atomic<bool>* cancel_flag = nullptr) const;

    std::uint64_t max_file_size() const { return max_file_size_; }
    std::uint32_t chunk_size() const { return chunk_manager_.get_chunk_size(); }

private:
    ChunkManager chunk_manager_;
    std::uint64_t max_file_size_;
};

} // namespace puresend::storage
