#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <span>
#include <cstdint>
#include "storage_config.hpp"
#include "file_metadata.hpp"
#include "../core/error.hpp"

namespace puresend::storage {

// Which chunks of a file are present; sized once per file.
class ChunkBitmap {
public:
    ChunkBitmap() = default;
    explicit ChunkBitmap(std::size_t chunk_count);

    void reset(std::size_t chunk_count);

    // False when `index` is outside the bitmap.
    bool mark(std::size_t index);
    void clear(std::size_t index);
    bool test(std::size_t index) const;

    std::size_t size() const { return bits_.size(); }
    std::size_t count() const { return count_; }
    bool complete() const { return count_ == bits_.size(); }

    std::optional<std::size_t> first_missing() const;
    std::vector<std::uint32_t> set_indices() const;

private:
    std::vector<bool> bits_;
    std::size_t count_ = 0;
};

class ChunkManager {
public:
    static constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024; // 1MB

    explicit ChunkManager(std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE);
    explicit ChunkManager(const StorageConfig& config);

    // Single pass over the file: fills the chunk table, per-chunk hashes and the whole-file hash.
    core::Result chunk_file(const std::filesystem::path& file_path,
                            FileMetadata& metadata,
                            const std::atomic<bool>* cancel_flag = nullptr) const;

    core::Result read_chunk(const std::filesystem::path& file_path,
                            const FileMetadata& metadata,
                            std::size_t chunk_index,
                            std::vector<std::uint8_t>& chunk_data) const;

    // Positional write followed by fsync; the chunk is durable when this returns success.
    core::Result write_chunk(const std::filesystem::path& file_path,
                             const FileMetadata& metadata,
                             std::size_t chunk_index,
                             std::span<const std::uint8_t> chunk_data) const;
    core::Result write_chunk(const std::filesystem::path& file_path,
                             const ChunkInfo& info,
                             std::span<const std::uint8_t> chunk_data) const;

    // Creates the file if needed and sizes it to `file_size` without touching existing bytes.
    core::Result prepare_destination(const std::filesystem::path& file_path,
                                     std::uint64_t file_size) const;

    static bool verify_chunk(std::span<const std::uint8_t> chunk_data,
                             const std::string& expected_hash);

    // Re-reads the listed chunks from disk; indices whose content no longer matches land in `failed`.
    core::Result verify_written_chunks(const std::filesystem::path& file_path,
                                       const FileMetadata& metadata,
                                       const std::vector<std::uint32_t>& chunk_indices,
                                       std::vector<std::uint32_t>& failed) const;

    std::uint32_t get_chunk_size() const { return chunk_size_; }

    void set_chunk_size(std::uint32_t new_size) { chunk_size_ = new_size; }

private:
    std::uint32_t chunk_size_;
};

} // namespace puresend::storage
