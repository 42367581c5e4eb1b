#include "puresend/storage/file_metadata.hpp"
#include "puresend/core/byte_buffer.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <unordered_map>

namespace puresend::storage {

namespace {
    constexpr std::uint8_t METADATA_FORMAT_VERSION = 1;

    const std::unordered_map<std::string, std::string>& mime_table() {
        static const std::unordered_map<std::string, std::string> table = {
            {"txt", "text/plain"},
            {"md", "text/markdown"},
            {"csv", "text/csv"},
            {"html", "text/html"},
            {"htm", "text/html"},
            {"css", "text/css"},
            {"js", "text/javascript"},
            {"json", "application/json"},
            {"xml", "application/xml"},
            {"pdf", "application/pdf"},
            {"doc", "application/msword"},
            {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {"xls", "application/vnd.ms-excel"},
            {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
            {"ppt", "application/vnd.ms-powerpoint"},
            {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
            {"zip", "application/zip"},
            {"gz", "application/gzip"},
            {"tar", "application/x-tar"},
            {"7z", "application/x-7z-compressed"},
            {"rar", "application/vnd.rar"},
            {"apk", "application/vnd.android.package-archive"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"png", "image/png"},
            {"gif", "image/gif"},
            {"webp", "image/webp"},
            {"bmp", "image/bmp"},
            {"svg", "image/svg+xml"},
            {"ico", "image/x-icon"},
            {"heic", "image/heic"},
            {"mp3", "audio/mpeg"},
            {"wav", "audio/wav"},
            {"flac", "audio/flac"},
            {"aac", "audio/aac"},
            {"ogg", "audio/ogg"},
            {"m4a", "audio/mp4"},
            {"mp4", "video/mp4"},
            {"mkv", "video/x-matroska"},
            {"avi", "video/x-msvideo"},
            {"mov", "video/quicktime"},
            {"webm", "video/webm"},
        };
        return table;
    }
}

const ChunkInfo* FileMetadata::chunk(std::size_t index) const {
    if (index >= chunks.size()) {
        return nullptr;
    }
    return &chunks[index];
}

bool FileMetadata::is_consistent() const {
    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& info = chunks[i];
        if (info.index != i || info.offset != expected_offset || info.size == 0) {
            return false;
        }
        if (i + 1 < chunks.size() && chunk_size != 0 && info.size != chunk_size) {
            return false;
        }
        expected_offset += info.size;
    }
    return expected_offset == size;
}

std::uint64_t FileMetadata::bytes_before(std::size_t chunk_index) const {
    if (chunk_index >= chunks.size()) {
        return size;
    }
    return chunks[chunk_index].offset;
}

std::vector<std::uint8_t> FileMetadata::serialize() const {
    std::vector<std::uint8_t> buffer;
    core::ByteWriter writer(buffer);

    writer.write_uint8(METADATA_FORMAT_VERSION);
    writer.write_string(id);
    writer.write_string(name);
    writer.write_uint64(size);
    writer.write_string(mime_type);
    writer.write_string(hash);
    writer.write_uint32(chunk_size);
    writer.write_bool(path.has_value());
    if (path) {
        writer.write_string(*path);
    }

    writer.write_uint32(static_cast<std::uint32_t>(chunks.size()));
    for (const auto& info : chunks) {
        writer.write_uint32(info.index);
        writer.write_uint64(info.offset);
        writer.write_uint64(info.size);
        writer.write_string(info.hash);
    }

    return buffer;
}

FileMetadata FileMetadata::deserialize(std::span<const std::uint8_t> data) {
    core::ByteReader reader(data);

    auto version = reader.read_uint8();
    if (version != METADATA_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported metadata format version " + std::to_string(version));
    }

    FileMetadata metadata;
    metadata.id = reader.read_string();
    metadata.name = reader.read_string();
    metadata.size = reader.read_uint64();
    metadata.mime_type = reader.read_string();
    metadata.hash = reader.read_string();
    metadata.chunk_size = reader.read_uint32();
    if (reader.read_bool()) {
        metadata.path = reader.read_string();
    }

    auto count = reader.read_uint32();
    // Each chunk needs at least 24 bytes; reject counts the payload cannot hold.
    if (static_cast<std::uint64_t>(count) * 24 > reader.remaining()) {
        throw std::runtime_error("Chunk table larger than payload");
    }
    metadata.chunks.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        ChunkInfo info;
        info.index = reader.read_uint32();
        info.offset = reader.read_uint64();
        info.size = reader.read_uint64();
        info.hash = reader.read_string();
        metadata.chunks.push_back(std::move(info));
    }

    return metadata;
}

std::vector<ChunkInfo> build_chunk_table(std::uint64_t file_size, std::uint32_t chunk_size) {
    std::vector<ChunkInfo> table;
    if (chunk_size == 0 || file_size == 0) {
        return table;
    }

    table.reserve(static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size));
    std::uint64_t offset = 0;
    std::uint32_t index = 0;
    while (offset < file_size) {
        ChunkInfo info;
        info.index = index++;
        info.offset = offset;
        info.size = std::min<std::uint64_t>(chunk_size, file_size - offset);
        offset += info.size;
        table.push_back(std::move(info));
    }
    return table;
}

std::string infer_mime_type(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) {
        return "application/octet-stream";
    }

    auto extension = core::utils::StringUtils::to_lower(filename.substr(dot + 1));
    const auto& table = mime_table();
    auto it = table.find(extension);
    return it != table.end() ? it->second : "application/octet-stream";
}

void to_json(nlohmann::json& j, const ChunkInfo& chunk) {
    j = nlohmann::json{
        {"index", chunk.index},
        {"offset", chunk.offset},
        {"size", chunk.size},
        {"hash", chunk.hash}
    };
}

void from_json(const nlohmann::json& j, ChunkInfo& chunk) {
    j.at("index").get_to(chunk.index);
    j.at("offset").get_to(chunk.offset);
    j.at("size").get_to(chunk.size);
    j.at("hash").get_to(chunk.hash);
}

void to_json(nlohmann::json& j, const FileMetadata& metadata) {
    j = nlohmann::json{
        {"id", metadata.id},
        {"name", metadata.name},
        {"size", metadata.size},
        {"mimeType", metadata.mime_type},
        {"hash", metadata.hash},
        {"chunks", metadata.chunks}
    };
    if (metadata.path) {
        j["path"] = *metadata.path;
    }
}

void from_json(const nlohmann::json& j, FileMetadata& metadata) {
    j.at("id").get_to(metadata.id);
    j.at("name").get_to(metadata.name);
    j.at("size").get_to(metadata.size);
    metadata.mime_type = j.value("mimeType", std::string("application/octet-stream"));
    j.at("hash").get_to(metadata.hash);
    metadata.chunks = j.value("chunks", std::vector<ChunkInfo>{});
    if (j.contains("path") && j["path"].is_string()) {
        metadata.path = j["path"].get<std::string>();
    } else {
        metadata.path.reset();
    }
    metadata.chunk_size = metadata.chunks.empty()
        ? 0 : static_cast<std::uint32_t>(metadata.chunks.front().size);
}

} // namespace puresend::storage
