#include "gtest/gtest.h"
#include "crypto/crypto.hpp"
#include <stdexcept>

using namespace awx::crypto;

namespace {

// Cheap parameters so the suite stays fast
const ScryptParams FAST_SCRYPT{1u << 10, 8, 1};

}

TEST(Base64Encoding, EmptyString) {
    ASSERT_EQ(base64Encode(""), "");
}

TEST(Base64Encoding, PaddingVariants) {
    ASSERT_EQ(base64Encode("f"), "Zg==");
    ASSERT_EQ(base64Encode("fo"), "Zm8=");
    ASSERT_EQ(base64Encode("foo"), "Zm9v");
    ASSERT_EQ(base64Encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Decoding, PaddingVariants) {
    ASSERT_EQ(base64Decode("Zg=="), "f");
    ASSERT_EQ(base64Decode("Zm8="), "fo");
    ASSERT_EQ(base64Decode("Zm9v"), "foo");
    ASSERT_EQ(base64Decode("SGVsbG8sIFdvcmxkIQ=="), "Hello, World!");
}

TEST(Base64RoundTrip, BinaryData) {
    std::string binary;
    for (int i = 0; i < 256; ++i) {
        binary.push_back(static_cast<char>(i));
    }
    ASSERT_EQ(base64Decode(base64Encode(binary)), binary);
}

TEST(SHA256Hashing, KnownVectors) {
    ASSERT_EQ(sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    ASSERT_EQ(sha256Hex("a"), "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb");
    ASSERT_EQ(sha256Hex("Hello, World!"), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(HashKeyNameFunction, ShouldProduceConsistent16CharacterHash) {
    std::string hash1 = hashKeyName("prod");
    std::string hash2 = hashKeyName("prod");

    ASSERT_EQ(hash1, hash2);
    ASSERT_EQ(hash1.length(), 16u);
    ASSERT_EQ(hash1, sha256Hex("prod").substr(0, 16));
}

TEST(HashKeyNameFunction, DifferentProfilesShouldProduceDifferentHashes) {
    ASSERT_NE(hashKeyName("prod"), hashKeyName("dev"));
}

TEST(RandomBytes, LengthAndVariety) {
    ASSERT_EQ(randomBytes(16).size(), 16u);
    ASSERT_EQ(randomBytes(0).size(), 0u);
    ASSERT_NE(randomBytes(32), randomBytes(32));
}

TEST(KeyDerivation, DeterministicPerSalt) {
    std::string salt(SALT_LEN, 's');
    std::string key1 = deriveKey("passphrase", salt, FAST_SCRYPT);
    std::string key2 = deriveKey("passphrase", salt, FAST_SCRYPT);

    ASSERT_EQ(key1.size(), KEY_LEN);
    ASSERT_EQ(key1, key2);
    ASSERT_NE(key1, deriveKey("passphrase", std::string(SALT_LEN, 't'), FAST_SCRYPT));
    ASSERT_NE(key1, deriveKey("other", salt, FAST_SCRYPT));
}

TEST(KeyDerivation, DefaultCostParametersWork) {
    std::string key = deriveKey("passphrase", std::string(SALT_LEN, 's'));
    ASSERT_EQ(key.size(), KEY_LEN);
}

TEST(AuthenticatedEncryption, SealThenOpen) {
    std::string key = deriveKey("pw", std::string(SALT_LEN, 'x'), FAST_SCRYPT);
    std::string sealed = seal(key, "secret payload", "prod");

    ASSERT_EQ(sealed.size(), NONCE_LEN + std::string("secret payload").size() + TAG_LEN);
    ASSERT_EQ(open(key, sealed, "prod"), "secret payload");
}

TEST(AuthenticatedEncryption, FreshNoncePerSeal) {
    std::string key = deriveKey("pw", std::string(SALT_LEN, 'x'), FAST_SCRYPT);
    ASSERT_NE(seal(key, "same", "prod"), seal(key, "same", "prod"));
}

TEST(AuthenticatedEncryption, WrongKeyFails) {
    std::string key = deriveKey("pw", std::string(SALT_LEN, 'x'), FAST_SCRYPT);
    std::string other = deriveKey("nope", std::string(SALT_LEN, 'x'), FAST_SCRYPT);
    std::string sealed = seal(key, "secret payload", "prod");

    ASSERT_THROW(open(other, sealed, "prod"), std::runtime_error);
}

TEST(AuthenticatedEncryption, WrongAssociatedDataFails) {
    std::string key = deriveKey("pw", std::string(SALT_LEN, 'x'), FAST_SCRYPT);
    std::string sealed = seal(key, "secret payload", "prod");

    ASSERT_THROW(open(key, sealed, "dev"), std::runtime_error);
}

TEST(AuthenticatedEncryption, TamperedCiphertextFails) {
    std::string key = deriveKey("pw", std::string(SALT_LEN, 'x'), FAST_SCRYPT);
    std::string sealed = seal(key, "secret payload", "prod");
    sealed[NONCE_LEN + 2] ^= 0x01;

    ASSERT_THROW(open(key, sealed, "prod"), std::runtime_error);
    ASSERT_THROW(open(key, "short", "prod"), std::runtime_error);
}

TEST(WipeFunction, ClearsBuffer) {
    std::string secret = "sensitive";
    wipe(secret);
    ASSERT_TRUE(secret.empty());
}
