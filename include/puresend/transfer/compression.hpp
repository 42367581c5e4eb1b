#pragma once

#include "../core/error.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace puresend::transfer {

enum class CompressionMode {
    Smart,  // level picked from the MIME type
    Manual  // fixed level for everything not on the skip list
};

const char* to_string(CompressionMode mode);
std::optional<CompressionMode> parse_compression_mode(const std::string& name);

struct CompressionSettings {
    bool enabled = true;
    CompressionMode mode = CompressionMode::Smart;
    int level = 6;
};

// zlib deflate of chunk payloads. Chunk hashes always cover the uncompressed bytes.
class Compressor {
public:
    static constexpr int MIN_LEVEL = 1;
    static constexpr int MAX_LEVEL = 9;

    explicit Compressor(CompressionSettings settings);

    // Formats that are already compressed gain nothing from another pass.
    static bool should_skip(const std::string& mime_type);
    static std::optional<int> smart_level(const std::string& mime_type);

    // Level for a file of this type, or nullopt when it goes uncompressed.
    std::optional<int> level_for(const std::string& mime_type) const;

    static core::Result compress(std::span<const std::uint8_t> data, int level, std::vector<std::uint8_t>& out);

    // `expected_size` is the chunk size from the chunk table; any other length is an error.
    static core::Result decompress(std::span<const std::uint8_t> data, std::size_t expected_size,
                                   std::vector<std::uint8_t>& out);

private:
    CompressionSettings settings_;
};

} // namespace puresend::transfer
