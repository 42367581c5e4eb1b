#include "puresend/crypto/random.hpp"
#include "puresend/core/logger.hpp"
#include <sodium.h>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace puresend::crypto {

void SecureRandom::initialize() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) {
            LOG_CRITICAL("Failed to initialize libsodium");
            throw std::runtime_error("Failed to initialize libsodium");
        }
        LOG_DEBUG("Cryptographic random number generator initialized");
    });
}

core::Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (output.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Output buffer is empty");
    }

    initialize();
    randombytes_buf(output.data(), output.size());
    return core::Result();
}

std::uint32_t SecureRandom::generate_uint32() {
    initialize();
    return randombytes_random();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    initialize();
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_id(size_t bytes) {
    initialize();
    std::vector<std::uint8_t> raw(bytes == 0 ? 1 : bytes);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(raw.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    hex.pop_back();
    return hex;
}

std::string SecureRandom::generate_digits(size_t digits) {
    initialize();
    std::string code;
    code.reserve(digits);
    for (size_t i = 0; i < digits; ++i) {
        code.push_back(static_cast<char>('0' + randombytes_uniform(10)));
    }
    return code;
}

} // namespace puresend::crypto
