#include "puresend/crypto/session_cipher.hpp"
#include "puresend/crypto/random.hpp"
#include <sodium.h>

namespace puresend::crypto {

static_assert(crypto_kx_PUBLICKEYBYTES == X25519_PUBLIC_KEY_SIZE);
static_assert(crypto_kx_SECRETKEYBYTES == X25519_SECRET_KEY_SIZE);
static_assert(crypto_kx_SESSIONKEYBYTES == CHACHA20_KEY_SIZE);
static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == CHACHA20_NONCE_SIZE);
static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == AEAD_TAG_SIZE);

SessionCipher::SessionCipher(Role role)
    : role_(role) {
    SecureRandom::initialize();
    crypto_kx_keypair(public_key_.data(), secret_key_.data());
}

SessionCipher::~SessionCipher() {
    sodium_memzero(secret_key_.data(), secret_key_.size());
    sodium_memzero(rx_key_.data(), rx_key_.size());
    sodium_memzero(tx_key_.data(), tx_key_.size());
}

core::Result SessionCipher::establish(const X25519PublicKey& peer_public_key) {
    int rc = 0;
    if (role_ == Role::Initiator) {
        rc = crypto_kx_client_session_keys(rx_key_.data(), tx_key_.data(),
                                           public_key_.data(), secret_key_.data(),
                                           peer_public_key.data());
    } else {
        rc = crypto_kx_server_session_keys(rx_key_.data(), tx_key_.data(),
                                           public_key_.data(), secret_key_.data(),
                                           peer_public_key.data());
    }

    if (rc != 0) {
        return core::Result(core::ErrorCode::VERIFICATION_ERROR, "Peer public key rejected");
    }

    established_ = true;
    return core::Result();
}

core::Result SessionCipher::seal(std::uint64_t sequence,
                                 std::span<const std::uint8_t> plaintext,
                                 std::span<const std::uint8_t> additional_data,
                                 std::vector<std::uint8_t>& out_ciphertext) const {
    if (!established_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "Cipher session not established");
    }

    auto nonce = make_nonce(sequence);
    out_ciphertext.resize(plaintext.size() + AEAD_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    int rc = crypto_aead_chacha20poly1305_ietf_encrypt(
        out_ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        additional_data.data(), additional_data.size(),
        nullptr, nonce.data(), tx_key_.data());

    if (rc != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "ChaCha20-Poly1305 encryption failed");
    }

    out_ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return core::Result();
}

core::Result SessionCipher::open(std::uint64_t sequence,
                                 std::span<const std::uint8_t> ciphertext,
                                 std::span<const std::uint8_t> additional_data,
                                 std::vector<std::uint8_t>& out_plaintext) const {
    if (!established_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "Cipher session not established");
    }

    if (ciphertext.size() < AEAD_TAG_SIZE) {
        return core::Result(core::ErrorCode::VERIFICATION_ERROR, "Ciphertext shorter than tag");
    }

    auto nonce = make_nonce(sequence);
    out_plaintext.resize(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;

    int rc = crypto_aead_chacha20poly1305_ietf_decrypt(
        out_plaintext.data(), &plaintext_len, nullptr,
        ciphertext.data(), ciphertext.size(),
        additional_data.data(), additional_data.size(),
        nonce.data(), rx_key_.data());

    if (rc != 0) {
        return core::Result(core::ErrorCode::VERIFICATION_ERROR, "ChaCha20-Poly1305 authentication failed");
    }

    out_plaintext.resize(static_cast<size_t>(plaintext_len));
    return core::Result();
}

ChaCha20Nonce SessionCipher::make_nonce(std::uint64_t sequence) {
    ChaCha20Nonce nonce{};
    for (size_t i = 0; i < 8; ++i) {
        nonce[CHACHA20_NONCE_SIZE - 1 - i] = static_cast<std::uint8_t>((sequence >> (i * 8)) & 0xFF);
    }
    return nonce;
}

} // namespace puresend::crypto
