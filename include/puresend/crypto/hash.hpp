#pragma once

#include "crypto_types.hpp"
#include "../core/error.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace puresend::crypto {

// Incremental SHA-256 over libsodium's crypto_hash_sha256.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(std::span<std::uint8_t> output);
    Sha256Hash finalize();

    void reset();

    static Sha256Hash hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, Sha256Hash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

Sha256Hash hash_string(const std::string& str);
std::string hash_hex(std::span<const std::uint8_t> data);
std::string hash_to_hex(const Sha256Hash& hash);
std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string);
bool verify_hash_hex(std::span<const std::uint8_t> data, const std::string& expected_hex);

}

} // namespace puresend::crypto
