#include <gtest/gtest.h>
#include "puresend/transfer/compression.hpp"
#include "puresend/storage/chunk_manager.hpp"
#include "puresend/crypto/hash.hpp"
#include <random>
#include <string>

using namespace puresend;
using namespace puresend::transfer;
using core::ErrorCode;

namespace {

std::vector<std::uint8_t> repeated_text(std::size_t size) {
    const std::string line = "PureSend moves files across the local network. ";
    std::vector<std::uint8_t> data;
    data.reserve(size);
    while (data.size() < size) {
        data.push_back(static_cast<std::uint8_t>(line[data.size() % line.size()]));
    }
    return data;
}

}

TEST(CompressionTest, DeflateShrinksTextAndInflatesBack) {
    auto data = repeated_text(256 * 1024);

    std::vector<std::uint8_t> deflated;
    ASSERT_TRUE(Compressor::compress(data, 6, deflated));
    EXPECT_LT(deflated.size(), data.size() / 10);

    std::vector<std::uint8_t> inflated;
    ASSERT_TRUE(Compressor::decompress(deflated, data.size(), inflated));
    EXPECT_EQ(inflated, data);
}

TEST(CompressionTest, InflateChecksTheChunkSize) {
    auto data = repeated_text(4096);
    std::vector<std::uint8_t> deflated;
    ASSERT_TRUE(Compressor::compress(data, 9, deflated));

    std::vector<std::uint8_t> inflated;
    EXPECT_EQ(Compressor::decompress(deflated, data.size() - 1, inflated).error, ErrorCode::VERIFICATION_ERROR);
    EXPECT_TRUE(inflated.empty());
    EXPECT_EQ(Compressor::decompress(deflated, data.size() + 1, inflated).error, ErrorCode::VERIFICATION_ERROR);

    deflated[deflated.size() / 2] ^= 0xFF;
    auto result = Compressor::decompress(deflated, data.size(), inflated);
    if (result) {
        // A flipped bit can still inflate; the chunk hash must then catch it.
        EXPECT_FALSE(storage::ChunkManager::verify_chunk(
            inflated, crypto::hash_utils::hash_to_hex(crypto::Sha256Hasher::hash(data))));
    } else {
        EXPECT_EQ(result.error, ErrorCode::VERIFICATION_ERROR);
    }

    EXPECT_EQ(Compressor::decompress({}, 10, inflated).error, ErrorCode::INVALID_ARGUMENT);
}

TEST(CompressionTest, RandomBytesDoNotShrink) {
    std::vector<std::uint8_t> data(64 * 1024);
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(rng));
    }

    std::vector<std::uint8_t> deflated;
    ASSERT_TRUE(Compressor::compress(data, 9, deflated));
    EXPECT_GE(deflated.size(), data.size());
}

TEST(CompressionTest, SkipListCoversCompressedFormats) {
    EXPECT_TRUE(Compressor::should_skip("application/zip"));
    EXPECT_TRUE(Compressor::should_skip("image/jpeg"));
    EXPECT_TRUE(Compressor::should_skip("video/mp4"));
    EXPECT_TRUE(Compressor::should_skip("Audio/MPEG"));
    EXPECT_FALSE(Compressor::should_skip("text/plain"));
    EXPECT_FALSE(Compressor::should_skip("image/png"));
    EXPECT_FALSE(Compressor::should_skip("application/octet-stream"));
}

TEST(CompressionTest, SmartLevelFollowsMimeType) {
    EXPECT_EQ(Compressor::smart_level("text/plain"), 9);
    EXPECT_EQ(Compressor::smart_level("application/json"), 9);
    EXPECT_EQ(Compressor::smart_level("application/pdf"), 9);
    EXPECT_EQ(Compressor::smart_level("image/png"), 3);
    EXPECT_EQ(Compressor::smart_level("application/octet-stream"), 3);
    EXPECT_FALSE(Compressor::smart_level("video/webm").has_value());
}

TEST(CompressionTest, SettingsPickTheLevel) {
    EXPECT_EQ(Compressor(CompressionSettings{}).level_for("text/csv"), 9);

    CompressionSettings manual{true, CompressionMode::Manual, 4};
    EXPECT_EQ(Compressor(manual).level_for("text/csv"), 4);
    EXPECT_EQ(Compressor(manual).level_for("application/octet-stream"), 4);
    EXPECT_FALSE(Compressor(manual).level_for("application/gzip").has_value());

    CompressionSettings clamped{true, CompressionMode::Manual, 42};
    EXPECT_EQ(Compressor(clamped).level_for("text/csv"), Compressor::MAX_LEVEL);

    CompressionSettings off{false, CompressionMode::Smart, 6};
    EXPECT_FALSE(Compressor(off).level_for("text/plain").has_value());
}

TEST(CompressionTest, ModeNames) {
    EXPECT_EQ(parse_compression_mode("smart"), CompressionMode::Smart);
    EXPECT_EQ(parse_compression_mode("MANUAL"), CompressionMode::Manual);
    EXPECT_FALSE(parse_compression_mode("zstd").has_value());
    EXPECT_STREQ(to_string(CompressionMode::Manual), "manual");
}
