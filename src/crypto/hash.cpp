#include "puresend/crypto/hash.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace puresend::crypto {

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() = default;

core::Result Sha256Hasher::initialize() {
    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "Failed to initialize SHA-256 hasher");
    }

    initialized_ = true;
    return core::Result();
}

core::Result Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "Hasher not initialized");
    }

    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "Failed to update hash");
    }

    return core::Result();
}

core::Result Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "Hasher not initialized");
    }

    if (output.size() < SHA256_HASH_SIZE) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Output buffer too small");
    }

    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return core::Result();
}

Sha256Hash Sha256Hasher::finalize() {
    Sha256Hash result;
    auto hash_result = finalize(std::span(result));
    if (!hash_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + hash_result.message);
    }
    return result;
}

void Sha256Hasher::reset() {
    initialized_ = false;
    auto result = initialize();
    if (!result.success()) {
        throw std::runtime_error("Failed to reset hasher: " + result.message);
    }
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

core::Result Sha256Hasher::hash_file(const std::filesystem::path& file_path, Sha256Hash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 1024 * 1024;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(std::span(output));
}

namespace hash_utils {

Sha256Hash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return Sha256Hasher::hash(data);
}

std::string hash_hex(std::span<const std::uint8_t> data) {
    return hash_to_hex(Sha256Hasher::hash(data));
}

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_HEX_LENGTH) {
        return std::nullopt;
    }

    Sha256Hash hash;
    size_t bin_len = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != SHA256_HASH_SIZE) {
        return std::nullopt;
    }

    return hash;
}

bool verify_hash_hex(std::span<const std::uint8_t> data, const std::string& expected_hex) {
    auto expected = hash_from_hex(expected_hex);
    if (!expected) {
        return false;
    }
    auto computed = Sha256Hasher::hash(data);
    return sodium_memcmp(computed.data(), expected->data(), SHA256_HASH_SIZE) == 0;
}

}

} // namespace puresend::crypto
