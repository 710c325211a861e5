#pragma once

#include "auth/credentials.hpp"
#include "core/config.hpp"
#include "crypto/crypto.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace awx {
namespace storage {

enum class CacheLocation {
    MEMORY,
    FILE,
    KEYCHAIN
};

std::string locationName(CacheLocation location);

struct CacheEntry {
    auth::CredentialSet credentials;
    std::optional<auth::TimePoint> expiration;
    CacheLocation location = CacheLocation::MEMORY;
};

// Entry <-> KEY=base64(value) lines
std::string serializeEntry(const std::string& profile, const auth::CredentialSet& creds,
                           auth::TimePoint storedAt);
// Throws CacheCorruptionError on anything unexpected, including a payload
// written for another profile.
auth::CredentialSet deserializeEntry(const std::string& profile, const std::string& payload);

// Raw payload storage keyed by profile name
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual CacheLocation location() const = 0;

    // nullopt when nothing is stored. Throws CacheCorruptionError when an
    // entry exists but cannot be read back.
    virtual std::optional<std::string> load(const std::string& profile) = 0;
    virtual void store(const std::string& profile, const std::string& payload) = 0;
    virtual void remove(const std::string& profile) = 0;
    virtual void removeAll() = 0;
};

class MemoryBackend : public CacheBackend {
public:
    CacheLocation location() const override { return CacheLocation::MEMORY; }
    std::optional<std::string> load(const std::string& profile) override;
    void store(const std::string& profile, const std::string& payload) override;
    void remove(const std::string& profile) override;
    void removeAll() override;

private:
    std::map<std::string, std::string> entries_;
};

// freedesktop Secret Service through secret-tool
class KeychainBackend : public CacheBackend {
public:
    explicit KeychainBackend(const core::Config& cfg);

    static bool available(const core::Config& cfg);

    CacheLocation location() const override { return CacheLocation::KEYCHAIN; }
    std::optional<std::string> load(const std::string& profile) override;
    void store(const std::string& profile, const std::string& payload) override;
    void remove(const std::string& profile) override;
    void removeAll() override;

private:
    const core::Config& cfg_;
    std::string tool_;
};

// One AES-256-GCM file per profile: "AWX1" | salt | nonce | ciphertext | tag
class EncryptedFileBackend : public CacheBackend {
public:
    using PassphraseSource = std::function<std::string()>;

    EncryptedFileBackend(std::filesystem::path dir, PassphraseSource passphrase,
                         crypto::ScryptParams params = crypto::ScryptParams());
    ~EncryptedFileBackend() override;

    CacheLocation location() const override { return CacheLocation::FILE; }
    std::optional<std::string> load(const std::string& profile) override;
    void store(const std::string& profile, const std::string& payload) override;
    void remove(const std::string& profile) override;
    void removeAll() override;

    std::filesystem::path pathFor(const std::string& profile) const;

private:
    const std::string& passphrase();

    std::filesystem::path dir_;
    PassphraseSource source_;
    crypto::ScryptParams params_;
    std::optional<std::string> passphrase_;
};

// Memory tier in front of an optional persistent backend. Reads are always
// expiry-checked; unreadable persistent entries are dropped and read as a miss.
class SessionCache {
public:
    using Clock = std::function<auth::TimePoint()>;

    explicit SessionCache(const core::Config& cfg, std::unique_ptr<CacheBackend> persistent = nullptr,
                          Clock clock = std::chrono::system_clock::now);

    // Persistent backend chosen from the configuration; memory-only unless
    // AWX_CACHE is set.
    static std::unique_ptr<SessionCache> fromConfig(const core::Config& cfg);

    std::optional<CacheEntry> get(const std::string& profile);
    void put(const std::string& profile, const auth::CredentialSet& creds);

    // "all" or a profile name
    void clear(const std::string& target);

    CacheLocation persistentLocation() const;

private:
    std::optional<CacheEntry> read(CacheBackend& backend, const std::string& profile);

    const core::Config& cfg_;
    MemoryBackend memory_;
    std::unique_ptr<CacheBackend> persistent_;
    Clock clock_;
};

} // namespace storage
} // namespace awx
