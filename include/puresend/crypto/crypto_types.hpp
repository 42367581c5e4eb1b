#pragma once

#include <array>
#include <vector>
#include <span>
#include <cstdint>

namespace puresend::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA256_HEX_LENGTH = SHA256_HASH_SIZE * 2;

constexpr size_t X25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t X25519_SECRET_KEY_SIZE = 32;

constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = POLY1305_TAG_SIZE;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

using X25519PublicKey = std::array<std::uint8_t, X25519_PUBLIC_KEY_SIZE>;
using X25519SecretKey = std::array<std::uint8_t, X25519_SECRET_KEY_SIZE>;

using ChaCha20Key = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;

} // namespace puresend::crypto
