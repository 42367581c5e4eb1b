#pragma once

#include "crypto_types.hpp"
#include "../core/error.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace puresend::crypto {

// Per-transfer authenticated encryption.
//
// Both ends generate an ephemeral X25519 key pair, exchange public keys inside the
// offer/response messages and derive directional ChaCha20-Poly1305 keys with crypto_kx.
// The chunk index is the nonce, so a session must never seal the same index twice; a
// resumed transfer negotiates a fresh session.
class SessionCipher {
public:
    enum class Role {
        Initiator, // the sending side
        Responder  // the receiving side
    };

    explicit SessionCipher(Role role);
    ~SessionCipher();

    SessionCipher(const SessionCipher&) = delete;
    SessionCipher& operator=(const SessionCipher&) = delete;

    const X25519PublicKey& public_key() const { return public_key_; }

    core::Result establish(const X25519PublicKey& peer_public_key);
    bool is_established() const { return established_; }

    core::Result seal(std::uint64_t sequence,
                      std::span<const std::uint8_t> plaintext,
                      std::span<const std::uint8_t> additional_data,
                      std::vector<std::uint8_t>& out_ciphertext) const;

    core::Result open(std::uint64_t sequence,
                      std::span<const std::uint8_t> ciphertext,
                      std::span<const std::uint8_t> additional_data,
                      std::vector<std::uint8_t>& out_plaintext) const;

private:
    static ChaCha20Nonce make_nonce(std::uint64_t sequence);

    Role role_;
    X25519PublicKey public_key_{};
    X25519SecretKey secret_key_{};
    ChaCha20Key rx_key_{};
    ChaCha20Key tx_key_{};
    bool established_ = false;
};

} // namespace puresend::crypto
