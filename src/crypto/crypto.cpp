#include "crypto/crypto.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace awx {
namespace crypto {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const unsigned char* bytes(const std::string& s)
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

unsigned char* bytes(std::string& s)
{
    return reinterpret_cast<unsigned char*>(&s[0]);
}

CipherCtx newCipherCtx()
{
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate cipher context");
    }
    return ctx;
}

} // namespace

// Base64 encoding
std::string base64Encode(const std::string& input) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    for (size_t pos = 0; pos < input.size(); pos += 3) {
        size_t len = std::min<size_t>(3, input.size() - pos);
        unsigned int triple = static_cast<unsigned char>(input[pos]) << 16;
        if (len > 1) triple |= static_cast<unsigned char>(input[pos + 1]) << 8;
        if (len > 2) triple |= static_cast<unsigned char>(input[pos + 2]);

        output.push_back(table[(triple >> 18) & 0x3F]);
        output.push_back(table[(triple >> 12) & 0x3F]);
        output.push_back(len >= 2 ? table[(triple >> 6) & 0x3F] : '=');
        output.push_back(len >= 3 ? table[triple & 0x3F] : '=');
    }

    return output;
}

// Base64 decoding
std::string base64Decode(const std::string& input) {
    auto val = [](char c) -> int {
        if ('A' <= c && c <= 'Z') return c - 'A';
        if ('a' <= c && c <= 'z') return c - 'a' + 26;
        if ('0' <= c && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::string output;
    output.reserve((input.size() / 4) * 3);

    int accum = 0, bits = 0;
    for (char c : input) {
        if (c == '=') break;
        int v = val(c);
        if (v < 0) continue;

        accum = ((accum << 6) | v) & 0xFFFFFF;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<char>((accum >> bits) & 0xFF));
        }
    }

    return output;
}

std::string sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA-256");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string hashKeyName(const std::string& name) {
    return sha256Hex(name).substr(0, 16);
}

std::string randomBytes(size_t count) {
    std::string out(count, '\0');
    if (count > 0 && RAND_bytes(bytes(out), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to obtain random bytes");
    }
    return out;
}

std::string deriveKey(const std::string& passphrase, const std::string& salt, const ScryptParams& params) {
    std::string key(KEY_LEN, '\0');
    // 128 * r * (N + 2) bytes of work memory plus slack; OpenSSL's 32 MiB
    // default is just short of what N=2^15, r=8 needs
    uint64_t maxmem = 128 * params.r * (params.n + 2) + (1u << 20);
    if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(),
                       bytes(salt), salt.size(),
                       params.n, params.r, params.p, maxmem,
                       bytes(key), key.size()) != 1) {
        throw std::runtime_error("Key derivation failed");
    }
    return key;
}

std::string seal(const std::string& key, const std::string& plaintext, const std::string& aad) {
    if (key.size() != KEY_LEN) {
        throw std::invalid_argument("AES-256-GCM requires a 32-byte key");
    }

    std::string nonce = randomBytes(NONCE_LEN);
    CipherCtx ctx = newCipherCtx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_LEN), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key), bytes(nonce)) != 1) {
        throw std::runtime_error("Failed to initialize encryption");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, bytes(aad), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("Failed to authenticate associated data");
    }

    std::string ciphertext(plaintext.size() + 16, '\0');
    int outLen = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), bytes(ciphertext), &outLen,
                          bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("Encryption failed");
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(ciphertext) + outLen, &finalLen) != 1) {
        throw std::runtime_error("Encryption failed");
    }
    ciphertext.resize(static_cast<size_t>(outLen + finalLen));

    std::string tag(TAG_LEN, '\0');
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_LEN), bytes(tag)) != 1) {
        throw std::runtime_error("Failed to read authentication tag");
    }

    return nonce + ciphertext + tag;
}

std::string open(const std::string& key, const std::string& sealed, const std::string& aad) {
    if (key.size() != KEY_LEN) {
        throw std::invalid_argument("AES-256-GCM requires a 32-byte key");
    }
    if (sealed.size() < NONCE_LEN + TAG_LEN) {
        throw std::runtime_error("Ciphertext too short");
    }

    std::string nonce = sealed.substr(0, NONCE_LEN);
    std::string ciphertext = sealed.substr(NONCE_LEN, sealed.size() - NONCE_LEN - TAG_LEN);
    std::string tag = sealed.substr(sealed.size() - TAG_LEN);

    CipherCtx ctx = newCipherCtx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_LEN), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key), bytes(nonce)) != 1) {
        throw std::runtime_error("Failed to initialize decryption");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, bytes(aad), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("Failed to authenticate associated data");
    }

    std::string plaintext(ciphertext.size() + 16, '\0');
    int outLen = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), bytes(plaintext), &outLen,
                          bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        throw std::runtime_error("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_LEN), bytes(tag)) != 1) {
        throw std::runtime_error("Failed to set authentication tag");
    }
    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(plaintext) + outLen, &finalLen) != 1) {
        wipe(plaintext);
        throw std::runtime_error("Authentication failed");
    }
    plaintext.resize(static_cast<size_t>(outLen + finalLen));
    return plaintext;
}

void wipe(std::string& secret) {
    if (!secret.empty()) {
        OPENSSL_cleanse(&secret[0], secret.size());
    }
    secret.clear();
}

} // namespace crypto
} // namespace awx
