#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace awx {
namespace crypto {

// Base64 encoding/decoding
std::string base64Encode(const std::string& input);
std::string base64Decode(const std::string& input);

// SHA-256 of the input as lowercase hex
std::string sha256Hex(const std::string& input);

// Utility function for hashing profile names into file names
std::string hashKeyName(const std::string& name);

// Cryptographically secure random bytes
std::string randomBytes(size_t count);

// scrypt cost parameters
struct ScryptParams {
    uint64_t n = 1u << 15;
    uint64_t r = 8;
    uint64_t p = 1;
};

constexpr size_t KEY_LEN = 32;
constexpr size_t SALT_LEN = 16;
constexpr size_t NONCE_LEN = 12;
constexpr size_t TAG_LEN = 16;

std::string deriveKey(const std::string& passphrase, const std::string& salt,
                      const ScryptParams& params = ScryptParams());

// AES-256-GCM. seal() returns nonce || ciphertext || tag with a fresh random
// nonce; open() throws std::runtime_error if authentication fails.
std::string seal(const std::string& key, const std::string& plaintext, const std::string& aad = "");
std::string open(const std::string& key, const std::string& sealed, const std::string& aad = "");

// Best-effort wipe of sensitive buffers
void wipe(std::string& secret);

} // namespace crypto
} // namespace awx
