#include "puresend/transfer/compression.hpp"
#include "puresend/core/utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace puresend::transfer {

namespace {
    const std::unordered_set<std::string>& precompressed_types() {
        static const std::unordered_set<std::string> types = {
            "application/zip",
            "application/gzip",
            "application/x-7z-compressed",
            "application/vnd.rar",
            "application/x-tar",
            "application/vnd.android.package-archive",
            "image/jpeg",
            "image/webp",
            "image/gif",
            "image/heic",
            "video/mp4",
            "video/x-matroska",
            "video/webm",
            "video/quicktime",
            "video/x-msvideo",
            "audio/mpeg",
            "audio/mp4",
            "audio/ogg",
            "audio/flac",
            "audio/aac",
        };
        return types;
    }

    const std::unordered_set<std::string>& document_types() {
        static const std::unordered_set<std::string> types = {
            "application/json",
            "application/xml",
            "application/javascript",
            "application/msword",
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
            "application/vnd.ms-excel",
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
            "application/vnd.ms-powerpoint",
            "application/vnd.openxmlformats-officedocument.presentationml.presentation",
            "application/pdf",
        };
        return types;
    }
}

const char* to_string(CompressionMode mode) {
    switch (mode) {
        case CompressionMode::Smart: return "smart";
        case CompressionMode::Manual: return "manual";
        default: return "unknown";
    }
}

std::optional<CompressionMode> parse_compression_mode(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);
    if (lower == "smart") {
        return CompressionMode::Smart;
    }
    if (lower == "manual") {
        return CompressionMode::Manual;
    }
    return std::nullopt;
}

Compressor::Compressor(CompressionSettings settings)
    : settings_(settings) {
    settings_.level = std::clamp(settings_.level, MIN_LEVEL, MAX_LEVEL);
}

bool Compressor::should_skip(const std::string& mime_type) {
    return precompressed_types().count(core::utils::StringUtils::to_lower(mime_type)) != 0;
}

std::optional<int> Compressor::smart_level(const std::string& mime_type) {
    if (should_skip(mime_type)) {
        return std::nullopt;
    }

    auto lower = core::utils::StringUtils::to_lower(mime_type);
    if (lower.starts_with("text/") || document_types().count(lower) != 0) {
        return Z_BEST_COMPRESSION;
    }
    return 3;
}

std::optional<int> Compressor::level_for(const std::string& mime_type) const {
    if (!settings_.enabled) {
        return std::nullopt;
    }
    if (settings_.mode == CompressionMode::Smart) {
        return smart_level(mime_type);
    }
    if (should_skip(mime_type)) {
        return std::nullopt;
    }
    return settings_.level;
}

core::Result Compressor::compress(std::span<const std::uint8_t> data, int level, std::vector<std::uint8_t>& out) {
    out.clear();
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<uLong>::max())) {
        return core::Result(core::ErrorCode::TOO_LARGE, "Chunk too large to compress");
    }

    auto source_len = static_cast<uLong>(data.size());
    uLongf out_len = compressBound(source_len);
    out.resize(static_cast<std::size_t>(out_len));

    int status = compress2(out.data(), &out_len, data.data(), source_len, std::clamp(level, MIN_LEVEL, MAX_LEVEL));
    if (status != Z_OK) {
        out.clear();
        return core::Result(core::ErrorCode::IO_ERROR, "Deflate failed with status " + std::to_string(status));
    }

    out.resize(static_cast<std::size_t>(out_len));
    return core::Result();
}

core::Result Compressor::decompress(std::span<const std::uint8_t> data, std::size_t expected_size,
                                    std::vector<std::uint8_t>& out) {
    out.clear();
    if (data.empty() || expected_size == 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Nothing to inflate");
    }
    if (expected_size > static_cast<std::size_t>(std::numeric_limits<uLong>::max()) ||
        data.size() > static_cast<std::size_t>(std::numeric_limits<uLong>::max())) {
        return core::Result(core::ErrorCode::TOO_LARGE, "Compressed chunk too large");
    }

    out.resize(expected_size);
    uLongf out_len = static_cast<uLongf>(expected_size);
    int status = uncompress(out.data(), &out_len, data.data(), static_cast<uLong>(data.size()));
    if (status != Z_OK || out_len != static_cast<uLongf>(expected_size)) {
        out.clear();
        return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                            status == Z_OK ? "Inflated chunk has the wrong size"
                                           : "Inflate failed with status " + std::to_string(status));
    }
    return core::Result();
}

} // namespace puresend::transfer
