#pragma once

#include <string>
#include <vector>
#include <optional>
#include <span>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace puresend::storage {

struct ChunkInfo {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
    std::string hash;

    bool operator==(const ChunkInfo& other) const = default;
};

struct FileMetadata {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::string hash;
    std::vector<ChunkInfo> chunks;
    std::optional<std::string> path;
    std::uint32_t chunk_size = 0;

    std::uint32_t chunk_count() const { return static_cast<std::uint32_t>(chunks.size()); }

    const ChunkInfo* chunk(std::size_t index) const;

    // Contiguous indices from 0, offsets chained, sizes summing to `size`, fixed size except the last.
    bool is_consistent() const;

    // Bytes covered by chunks [0, chunk_index).
    std::uint64_t bytes_before(std::size_t chunk_index) const;

    std::vector<std::uint8_t> serialize() const;
    static FileMetadata deserialize(std::span<const std::uint8_t> data);

    bool operator==(const FileMetadata& other) const = default;
};

// Offsets and sizes for a file of `file_size` bytes; hashes are left empty.
std::vector<ChunkInfo> build_chunk_table(std::uint64_t file_size, std::uint32_t chunk_size);

std::string infer_mime_type(const std::string& filename);

void to_json(nlohmann::json& j, const ChunkInfo& chunk);
void from_json(const nlohmann::json& j, ChunkInfo& chunk);
void to_json(nlohmann::json& j, const FileMetadata& metadata);
void from_json(const nlohmann::json& j, FileMetadata& metadata);

} // namespace puresend::storage
