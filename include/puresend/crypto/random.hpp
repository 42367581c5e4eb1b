#pragma once

#include "../core/error.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace puresend::crypto {

class SecureRandom {
public:
    // Safe to call repeatedly; throws std::runtime_error when libsodium cannot start.
    static void initialize();

    static core::Result generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uint32();
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

    // Lowercase hex identifier built from `bytes` random bytes.
    static std::string generate_id(size_t bytes = 16);

    // Decimal code of exactly `digits` digits, leading zeros allowed.
    static std::string generate_digits(size_t digits);
};

} // namespace puresend::crypto
