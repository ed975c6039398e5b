/**
 * @file test_transfer_crypto.cpp
 * @brief Unit tests for key derivation and per-chunk AEAD
 *
 * Tests cryptographic operations including:
 * - Shared-secret key derivation
 * - Session key separation by seed
 * - Chunk sealing and opening
 * - Tamper, reorder and wrong-key detection
 * - Nonce reuse refusal
 */

#include <gtest/gtest.h>
#include "meshpulse/transfer_crypto.hpp"

#include <string>
#include <vector>

using namespace meshpulse;

class TransferCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(TransferCrypto::initialize());

        auto key = TransferCrypto::derive_master_key("correct horse", KeyDerivationParams::minimal());
        ASSERT_TRUE(key.has_value());
        master_ = *key;
        seed_ = TransferCrypto::generate_session_seed();
        plaintext_ = std::vector<uint8_t>(1000);
        for (size_t i = 0; i < plaintext_.size(); ++i) {
            plaintext_[i] = static_cast<uint8_t>(i * 31);
        }
    }

    MasterKey master_{};
    SessionSeed seed_{};
    std::vector<uint8_t> plaintext_;
};

// ============================================================================
// Key Derivation
// ============================================================================

TEST_F(TransferCryptoTest, DerivationIsDeterministic) {
    auto again = TransferCrypto::derive_master_key("correct horse", KeyDerivationParams::minimal());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, master_);
}

TEST_F(TransferCryptoTest, DifferentSecretsGiveDifferentKeys) {
    auto other = TransferCrypto::derive_master_key("battery staple", KeyDerivationParams::minimal());
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(*other, master_);
}

TEST_F(TransferCryptoTest, EmptySecretIsRefused) {
    EXPECT_FALSE(TransferCrypto::derive_master_key("", KeyDerivationParams::minimal()).has_value());
}

TEST_F(TransferCryptoTest, SessionSeedsAreRandom) {
    EXPECT_NE(TransferCrypto::generate_session_seed(), TransferCrypto::generate_session_seed());
}

TEST_F(TransferCryptoTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};
    EXPECT_TRUE(TransferCrypto::constant_time_compare(a.data(), b.data(), a.size()));
    EXPECT_FALSE(TransferCrypto::constant_time_compare(a.data(), c.data(), a.size()));
}

// ============================================================================
// Sealing and Opening
// ============================================================================

TEST_F(TransferCryptoTest, SealThenOpenRecoversPlaintext) {
    CryptoContext sender(master_, seed_);
    CryptoContext receiver(master_, seed_);

    auto sealed = sender.seal(0, plaintext_.data(), plaintext_.size());
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed->ciphertext.size(), plaintext_.size());
    EXPECT_NE(sealed->ciphertext, plaintext_);

    auto opened = receiver.open(0, sealed->ciphertext.data(), sealed->ciphertext.size(), sealed->tag);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext_);
}

TEST_F(TransferCryptoTest, SameChunkDiffersAcrossSessions) {
    CryptoContext first(master_, seed_);
    CryptoContext second(master_, TransferCrypto::generate_session_seed());

    auto a = first.seal(0, plaintext_.data(), plaintext_.size());
    auto b = second.seal(0, plaintext_.data(), plaintext_.size());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->ciphertext, b->ciphertext);
}

TEST_F(TransferCryptoTest, TamperedCiphertextFails) {
    CryptoContext ctx(master_, seed_);
    auto sealed = ctx.seal(0, plaintext_.data(), plaintext_.size());
    ASSERT_TRUE(sealed.has_value());

    sealed->ciphertext[10] ^= 0x01;
    EXPECT_FALSE(ctx.open(0, sealed->ciphertext.data(), sealed->ciphertext.size(), sealed->tag).has_value());
}

TEST_F(TransferCryptoTest, TamperedTagFails) {
    CryptoContext ctx(master_, seed_);
    auto sealed = ctx.seal(0, plaintext_.data(), plaintext_.size());
    ASSERT_TRUE(sealed.has_value());

    sealed->tag[0] ^= 0x80;
    EXPECT_FALSE(ctx.open(0, sealed->ciphertext.data(), sealed->ciphertext.size(), sealed->tag).has_value());
}

TEST_F(TransferCryptoTest, ChunkOpenedUnderWrongIndexFails) {
    CryptoContext ctx(master_, seed_);
    auto sealed = ctx.seal(3, plaintext_.data(), plaintext_.size());
    ASSERT_TRUE(sealed.has_value());

    EXPECT_FALSE(ctx.open(4, sealed->ciphertext.data(), sealed->ciphertext.size(), sealed->tag).has_value());
    EXPECT_TRUE(ctx.open(3, sealed->ciphertext.data(), sealed->ciphertext.size(), sealed->tag).has_value());
}

TEST_F(TransferCryptoTest, WrongSecretFails) {
    auto wrong = TransferCrypto::derive_master_key("wrong secret", KeyDerivationParams::minimal());
    ASSERT_TRUE(wrong.has_value());

    CryptoContext sender(master_, seed_);
    CryptoContext receiver(*wrong, seed_);

    auto sealed = sender.seal(0, plaintext_.data(), plaintext_.size());
    ASSERT_TRUE(sealed.has_value());
    EXPECT_FALSE(receiver.open(0, sealed->ciphertext.data(), sealed->ciphertext.size(), sealed->tag).has_value());
}

TEST_F(TransferCryptoTest, SealRefusesIndexReuse) {
    CryptoContext ctx(master_, seed_);

    ASSERT_TRUE(ctx.seal(0, plaintext_.data(), plaintext_.size()).has_value());
    ASSERT_TRUE(ctx.seal(1, plaintext_.data(), plaintext_.size()).has_value());
    EXPECT_FALSE(ctx.seal(1, plaintext_.data(), plaintext_.size()).has_value());
    EXPECT_FALSE(ctx.seal(0, plaintext_.data(), plaintext_.size()).has_value());
    EXPECT_EQ(ctx.get_sealed_count(), 2u);
}

TEST_F(TransferCryptoTest, EmptyChunkStillAuthenticated) {
    CryptoContext ctx(master_, seed_);
    auto sealed = ctx.seal(0, nullptr, 0);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_TRUE(sealed->ciphertext.empty());

    auto opened = ctx.open(0, nullptr, 0, sealed->tag);
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(opened->empty());

    sealed->tag[5] ^= 0x01;
    EXPECT_FALSE(ctx.open(0, nullptr, 0, sealed->tag).has_value());
}
