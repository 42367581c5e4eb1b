#include <gtest/gtest.h>
#include "puresend/crypto/session_cipher.hpp"
#include "puresend/crypto/hash.hpp"
#include "puresend/crypto/random.hpp"
#include <set>
#include <string>

namespace puresend::crypto::test {

using core::ErrorCode;

class SessionCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        sender_ = std::make_unique<SessionCipher>(SessionCipher::Role::Initiator);
        receiver_ = std::make_unique<SessionCipher>(SessionCipher::Role::Responder);

        ASSERT_TRUE(sender_->establish(receiver_->public_key()));
        ASSERT_TRUE(receiver_->establish(sender_->public_key()));

        plaintext_.assign(4096, 0);
        for (size_t i = 0; i < plaintext_.size(); ++i) {
            plaintext_[i] = static_cast<std::uint8_t>(i * 7);
        }
        aad_ = {'t', 'a', 's', 'k', '-', '1'};
    }

    std::unique_ptr<SessionCipher> sender_;
    std::unique_ptr<SessionCipher> receiver_;
    std::vector<std::uint8_t> plaintext_;
    std::vector<std::uint8_t> aad_;
};

TEST_F(SessionCipherTest, SealAndOpen) {
    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(sender_->seal(3, plaintext_, aad_, ciphertext));
    EXPECT_EQ(ciphertext.size(), plaintext_.size() + AEAD_TAG_SIZE);
    EXPECT_NE(std::vector<std::uint8_t>(ciphertext.begin(), ciphertext.begin() + 64),
              std::vector<std::uint8_t>(plaintext_.begin(), plaintext_.begin() + 64));

    std::vector<std::uint8_t> opened;
    ASSERT_TRUE(receiver_->open(3, ciphertext, aad_, opened));
    EXPECT_EQ(opened, plaintext_);
}

TEST_F(SessionCipherTest, WrongSequenceFails) {
    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(sender_->seal(3, plaintext_, aad_, ciphertext));

    std::vector<std::uint8_t> opened;
    EXPECT_EQ(receiver_->open(4, ciphertext, aad_, opened).error, ErrorCode::VERIFICATION_ERROR);
}

TEST_F(SessionCipherTest, TamperedDataFails) {
    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(sender_->seal(0, plaintext_, aad_, ciphertext));

    std::vector<std::uint8_t> opened;
    auto tampered = ciphertext;
    tampered[10] ^= 0x01;
    EXPECT_FALSE(receiver_->open(0, tampered, aad_, opened));

    std::vector<std::uint8_t> other_aad = {'t', 'a', 's', 'k', '-', '2'};
    EXPECT_FALSE(receiver_->open(0, ciphertext, other_aad, opened));

    std::vector<std::uint8_t> truncated(ciphertext.begin(), ciphertext.begin() + 8);
    EXPECT_EQ(receiver_->open(0, truncated, aad_, opened).error, ErrorCode::VERIFICATION_ERROR);
}

TEST_F(SessionCipherTest, DirectionsUseSeparateKeys) {
    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(sender_->seal(1, plaintext_, aad_, ciphertext));

    // A sender cannot open its own output.
    std::vector<std::uint8_t> opened;
    EXPECT_FALSE(sender_->open(1, ciphertext, aad_, opened));
}

TEST_F(SessionCipherTest, UnestablishedSessionRefuses) {
    SessionCipher fresh(SessionCipher::Role::Initiator);
    EXPECT_FALSE(fresh.is_established());

    std::vector<std::uint8_t> out;
    EXPECT_EQ(fresh.seal(0, plaintext_, aad_, out).error, ErrorCode::STATE_ERROR);
    EXPECT_EQ(fresh.open(0, plaintext_, aad_, out).error, ErrorCode::STATE_ERROR);
}

TEST_F(SessionCipherTest, ThirdPartyCannotOpen) {
    SessionCipher eavesdropper(SessionCipher::Role::Responder);
    ASSERT_TRUE(eavesdropper.establish(sender_->public_key()));

    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(sender_->seal(0, plaintext_, aad_, ciphertext));

    std::vector<std::uint8_t> opened;
    EXPECT_FALSE(eavesdropper.open(0, ciphertext, aad_, opened));
}

TEST(HashTest, KnownVectors) {
    EXPECT_EQ(hash_utils::hash_to_hex(hash_utils::hash_string("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash_utils::hash_to_hex(hash_utils::hash_string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashTest, IncrementalMatchesOneShot) {
    std::string text = "The quick brown fox jumps over the lazy dog";
    std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());

    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(bytes.subspan(0, 10)));
    ASSERT_TRUE(hasher.update(bytes.subspan(10)));
    EXPECT_EQ(hasher.finalize(), Sha256Hasher::hash(bytes));
}

TEST(HashTest, HexHelpers) {
    std::vector<std::uint8_t> data = {1, 2, 3};
    auto hex = hash_utils::hash_hex(data);
    EXPECT_EQ(hex.size(), SHA256_HEX_LENGTH);
    EXPECT_TRUE(hash_utils::verify_hash_hex(data, hex));

    data[0] = 9;
    EXPECT_FALSE(hash_utils::verify_hash_hex(data, hex));
    EXPECT_FALSE(hash_utils::verify_hash_hex(data, "not-hex"));
    EXPECT_FALSE(hash_utils::hash_from_hex(std::string(64, 'z')).has_value());
}

TEST(SecureRandomTest, IdsAndDigits) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = SecureRandom::generate_id(8);
        EXPECT_EQ(id.size(), 16u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);

    auto pin = SecureRandom::generate_digits(6);
    EXPECT_EQ(pin.size(), 6u);
    EXPECT_EQ(pin.find_first_not_of("0123456789"), std::string::npos);

    for (int i = 0; i < 100; ++i) {
        EXPECT_LT(SecureRandom::generate_uniform(10), 10u);
    }
}

}
