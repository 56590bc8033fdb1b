#include <gtest/gtest.h>
#include <set>
#include <string>
#include "crypto/credential_cipher.hpp"
#include "test_utils.hpp"

using namespace dbridge::crypto;

class CredentialCipherTest : public ::testing::Test {
protected:
    CredentialCipher cipher{dbridge::test::make_test_key()};
};

// Test basic encryption and decryption
TEST_F(CredentialCipherTest, RoundTrip) {
    const std::string secret = "myPassword123!";
    std::string blob = cipher.encrypt(secret);

    EXPECT_NE(blob, secret);
    EXPECT_EQ(cipher.decrypt(blob), secret);
}

TEST_F(CredentialCipherTest, RoundTripUnicodeAndLongValues) {
    const std::string unicode = "p\xC3\xA4ssw\xC3\xB6rd \xE2\x82\xAC \xF0\x9F\x94\x91";
    EXPECT_EQ(cipher.decrypt(cipher.encrypt(unicode)), unicode);

    const std::string long_value(1000, 'x');
    EXPECT_EQ(cipher.decrypt(cipher.encrypt(long_value)), long_value);

    // Exactly one block still gets a full padding block
    const std::string one_block(CredentialCipher::BLOCK_SIZE, 'b');
    EXPECT_EQ(cipher.decrypt(cipher.encrypt(one_block)), one_block);
}

TEST_F(CredentialCipherTest, EmptyValuesPassThrough) {
    EXPECT_EQ(cipher.encrypt(""), "");
    EXPECT_EQ(cipher.decrypt(""), "");
}

TEST_F(CredentialCipherTest, FreshIvPerEncryption) {
    std::set<std::string> blobs;
    for (int i = 0; i < 20; ++i) {
        blobs.insert(cipher.encrypt("same plaintext"));
    }
    EXPECT_EQ(blobs.size(), 20u);
}

TEST_F(CredentialCipherTest, BlobLayoutIsIvPlusPaddedCiphertext) {
    // 5 bytes pad to one block: 16 IV + 16 ciphertext = 32 bytes -> 44 base64 chars
    std::string blob = cipher.encrypt("hello");
    EXPECT_EQ(blob.size(), 44u);
    EXPECT_EQ(blob.find_first_not_of(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/="), std::string::npos);
}

TEST_F(CredentialCipherTest, MalformedBase64IsRejected) {
    EXPECT_THROW(cipher.decrypt("not base64!"), DecryptionError);
    EXPECT_THROW(cipher.decrypt("abc"), DecryptionError);
    EXPECT_THROW(cipher.decrypt("@@@@@@@@"), DecryptionError);
}

TEST_F(CredentialCipherTest, TruncatedBlobIsRejected) {
    std::string blob = cipher.encrypt("a value worth keeping secret");

    // Shorter than an IV
    EXPECT_THROW(cipher.decrypt("AAAAAAAA"), DecryptionError);
    // IV only, no ciphertext: 16 zero bytes
    EXPECT_THROW(cipher.decrypt("AAAAAAAAAAAAAAAAAAAAAA=="), DecryptionError);
    // Cut on a base64 quantum but not on a block boundary
    EXPECT_THROW(cipher.decrypt(blob.substr(0, blob.size() - 8)), DecryptionError);
}

TEST_F(CredentialCipherTest, WrongKeyNeverYieldsPlaintext) {
    const std::string secret = "correct horse battery staple";
    std::string blob = cipher.encrypt(secret);

    CredentialCipher other(dbridge::test::make_test_key(0x24));
    try {
        EXPECT_NE(other.decrypt(blob), secret);
    } catch (const DecryptionError&) {
        SUCCEED();
    }
}

TEST_F(CredentialCipherTest, DecryptionErrorIsACryptoError) {
    EXPECT_THROW(cipher.decrypt("####"), CryptoError);
}

TEST_F(CredentialCipherTest, WipeMakesCipherUnusable) {
    std::string blob = cipher.encrypt("secret");
    ASSERT_TRUE(cipher.is_usable());

    cipher.wipe();
    EXPECT_FALSE(cipher.is_usable());
    EXPECT_THROW(cipher.encrypt("secret"), InitializationError);
    EXPECT_THROW(cipher.decrypt(blob), InitializationError);
}

TEST_F(CredentialCipherTest, MoveTransfersKey) {
    std::string blob = cipher.encrypt("secret");
    CredentialCipher moved(std::move(cipher));

    EXPECT_TRUE(moved.is_usable());
    EXPECT_EQ(moved.decrypt(blob), "secret");
}

TEST(CredentialCipherConstructionTest, InvalidKeySizeIsRejected) {
    EXPECT_THROW(CredentialCipher{SymmetricKey(16, 0x01)}, InitializationError);
    EXPECT_THROW(CredentialCipher{SymmetricKey{}}, InitializationError);
}

TEST(CredentialCipherConstructionTest, GeneratedIvsDiffer) {
    EXPECT_NE(CredentialCipher::generate_iv(), CredentialCipher::generate_iv());
}
