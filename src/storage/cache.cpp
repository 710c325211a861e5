#include "storage/cache.hpp"
#include "core/errors.hpp"
#include "system/system.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace awx {
namespace storage {

namespace fs = std::filesystem;

namespace {

const std::string MAGIC = "AWX1";
const std::string ENTRY_VERSION = "1";
const std::string FILE_SUFFIX = ".cache";

std::string unixSeconds(auth::TimePoint tp)
{
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

std::optional<auth::TimePoint> parseUnixSeconds(const std::string& text)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return auth::TimePoint(std::chrono::seconds(std::stoll(text)));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

std::string locationName(CacheLocation location) {
    switch (location) {
        case CacheLocation::MEMORY: return "memory";
        case CacheLocation::FILE: return "file";
        case CacheLocation::KEYCHAIN: return "keychain";
    }
    return "unknown";
}

// Serialization
std::string serializeEntry(const std::string& profile, const auth::CredentialSet& creds,
                           auth::TimePoint storedAt) {
    std::ostringstream out;
    auto line = [&](const char* key, const std::string& value) {
        out << key << "=" << crypto::base64Encode(value) << "\n";
    };
    line("version", ENTRY_VERSION);
    line("profile", profile);
    line("access_key_id", creds.accessKeyId);
    line("secret_access_key", creds.secretAccessKey);
    line("session_token", creds.sessionToken.value_or(""));
    line("region", creds.region.value_or(""));
    line("expiration", creds.expiration ? unixSeconds(*creds.expiration) : "");
    line("stored_at", unixSeconds(storedAt));
    return out.str();
}

auth::CredentialSet deserializeEntry(const std::string& profile, const std::string& payload) {
    std::map<std::string, std::string> kv;
    std::istringstream lines(payload);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw core::CacheCorruptionError("Malformed cache entry for '" + profile + "'");
        }
        kv[line.substr(0, eq)] = crypto::base64Decode(line.substr(eq + 1));
    }

    if (kv["version"] != ENTRY_VERSION) {
        throw core::CacheCorruptionError("Unsupported cache entry version for '" + profile + "'");
    }
    if (kv["profile"] != profile) {
        throw core::CacheCorruptionError("Cache entry does not belong to '" + profile + "'");
    }
    if (kv["access_key_id"].empty() || kv["secret_access_key"].empty()) {
        throw core::CacheCorruptionError("Incomplete cache entry for '" + profile + "'");
    }

    auth::CredentialSet creds;
    creds.accessKeyId = kv["access_key_id"];
    creds.secretAccessKey = kv["secret_access_key"];
    if (!kv["session_token"].empty()) {
        creds.sessionToken = kv["session_token"];
    }
    if (!kv["region"].empty()) {
        creds.region = kv["region"];
    }
    if (!kv["expiration"].empty()) {
        creds.expiration = parseUnixSeconds(kv["expiration"]);
        if (!creds.expiration) {
            throw core::CacheCorruptionError("Invalid expiration in cache entry for '" + profile + "'");
        }
    }
    return creds;
}

// MemoryBackend
std::optional<std::string> MemoryBackend::load(const std::string& profile) {
    auto it = entries_.find(profile);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryBackend::store(const std::string& profile, const std::string& payload) {
    entries_[profile] = payload;
}

void MemoryBackend::remove(const std::string& profile) {
    entries_.erase(profile);
}

void MemoryBackend::removeAll() {
    entries_.clear();
}

// KeychainBackend
KeychainBackend::KeychainBackend(const core::Config& cfg)
    : cfg_(cfg), tool_(system::findExecutable("secret-tool").value_or("secret-tool")) {}

bool KeychainBackend::available(const core::Config& cfg) {
    return !cfg.forceFileCache
        && !core::getenvs("DBUS_SESSION_BUS_ADDRESS").empty()
        && system::commandExists("secret-tool");
}

std::optional<std::string> KeychainBackend::load(const std::string& profile) {
    auto result = system::runProcess(tool_, {"secret-tool", "lookup", "service", "awx", "profile", profile},
                                     system::currentEnvironment(), cfg_.requestTimeout);
    std::string encoded = core::trim(result.out);
    if (!result.success() || encoded.empty()) {
        if (result.timedOut) {
            core::debug(cfg_, "secret-tool lookup timed out; treating as a cache miss");
        }
        return std::nullopt;
    }
    std::string payload = crypto::base64Decode(encoded);
    if (payload.empty()) {
        throw core::CacheCorruptionError("Keychain entry for '" + profile + "' is not valid");
    }
    return payload;
}

void KeychainBackend::store(const std::string& profile, const std::string& payload) {
    auto result = system::runProcess(tool_,
                                     {"secret-tool", "store", "--label=awx session (" + profile + ")",
                                      "service", "awx", "profile", profile},
                                     system::currentEnvironment(), cfg_.requestTimeout,
                                     crypto::base64Encode(payload));
    if (!result.success()) {
        throw std::runtime_error("secret-tool store failed");
    }
}

void KeychainBackend::remove(const std::string& profile) {
    auto result = system::runProcess(tool_, {"secret-tool", "clear", "service", "awx", "profile", profile},
                                     system::currentEnvironment(), cfg_.requestTimeout);
    if (!result.success()) {
        core::debug(cfg_, "secret-tool clear found nothing for '" + profile + "'");
    }
}

void KeychainBackend::removeAll() {
    auto result = system::runProcess(tool_, {"secret-tool", "clear", "service", "awx"},
                                     system::currentEnvironment(), cfg_.requestTimeout);
    if (!result.success()) {
        core::debug(cfg_, "secret-tool clear found nothing");
    }
}

// EncryptedFileBackend
EncryptedFileBackend::EncryptedFileBackend(fs::path dir, PassphraseSource passphrase,
                                           crypto::ScryptParams params)
    : dir_(std::move(dir)), source_(std::move(passphrase)), params_(params) {}

EncryptedFileBackend::~EncryptedFileBackend() {
    if (passphrase_) {
        crypto::wipe(*passphrase_);
    }
}

fs::path EncryptedFileBackend::pathFor(const std::string& profile) const {
    return dir_ / (crypto::hashKeyName(profile) + FILE_SUFFIX);
}

const std::string& EncryptedFileBackend::passphrase() {
    if (!passphrase_) {
        if (!source_) {
            throw core::ConfigError("No cache passphrase available", "Set AWX_CACHE_PASSPHRASE");
        }
        std::string value = source_();
        if (value.empty()) {
            throw core::ConfigError("Cache passphrase must not be empty", "Set AWX_CACHE_PASSPHRASE");
        }
        passphrase_ = std::move(value);
    }
    return *passphrase_;
}

std::optional<std::string> EncryptedFileBackend::load(const std::string& profile) {
    fs::path path = pathFor(profile);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::CacheCorruptionError("Cache entry for '" + profile + "' is unreadable");
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    const size_t header = MAGIC.size() + crypto::SALT_LEN;
    if (data.size() < header + crypto::NONCE_LEN + crypto::TAG_LEN || data.compare(0, MAGIC.size(), MAGIC) != 0) {
        throw core::CacheCorruptionError("Cache entry for '" + profile + "' has an invalid header");
    }

    std::string key = crypto::deriveKey(passphrase(), data.substr(MAGIC.size(), crypto::SALT_LEN), params_);
    std::string plain;
    try {
        plain = crypto::open(key, data.substr(header), profile);
    } catch (const std::runtime_error&) {
        crypto::wipe(key);
        throw core::CacheCorruptionError("Cache entry for '" + profile + "' could not be decrypted");
    }
    crypto::wipe(key);
    return plain;
}

void EncryptedFileBackend::store(const std::string& profile, const std::string& payload) {
    system::ensureSecureDir(dir_);

    std::string salt = crypto::randomBytes(crypto::SALT_LEN);
    std::string key = crypto::deriveKey(passphrase(), salt, params_);
    std::string blob = MAGIC + salt + crypto::seal(key, payload, profile);
    crypto::wipe(key);

    fs::path target = pathFor(profile);
    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to create " + tmp.string());
        }
        system::secureChmod(tmp, 0600);
        out.write(blob.data(), static_cast<std::streamsize>(blob.size()));
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Failed to write " + tmp.string());
        }
    }
    fs::rename(tmp, target);
}

void EncryptedFileBackend::remove(const std::string& profile) {
    std::error_code ec;
    fs::remove(pathFor(profile), ec);
}

void EncryptedFileBackend::removeAll() {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return;
    }
    for (const auto& entry : fs::directory_iterator(dir_)) {
        std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.find(FILE_SUFFIX) != std::string::npos) {
            fs::remove(entry.path(), ec);
        }
    }
}

// SessionCache
SessionCache::SessionCache(const core::Config& cfg, std::unique_ptr<CacheBackend> persistent, Clock clock)
    : cfg_(cfg), persistent_(std::move(persistent)), clock_(std::move(clock)) {}

std::unique_ptr<SessionCache> SessionCache::fromConfig(const core::Config& cfg) {
    if (!cfg.cacheEnabled) {
        return std::make_unique<SessionCache>(cfg);
    }

    if (KeychainBackend::available(cfg)) {
        core::debug(cfg, "Session cache: keychain (secret-tool)");
        return std::make_unique<SessionCache>(cfg, std::make_unique<KeychainBackend>(cfg));
    }

    EncryptedFileBackend::PassphraseSource source;
    if (!cfg.cachePassphrase.empty()) {
        std::string preset = cfg.cachePassphrase;
        source = [preset]() { return preset; };
    } else if (cfg.interactive && system::stdinIsTerminal()) {
        source = []() { return system::promptSecret("Cache passphrase: "); };
    } else {
        core::info(cfg, "Persistent cache disabled: set AWX_CACHE_PASSPHRASE for the file cache");
        return std::make_unique<SessionCache>(cfg);
    }

    core::debug(cfg, "Session cache: encrypted files in " + cfg.cacheDir);
    return std::make_unique<SessionCache>(
        cfg, std::make_unique<EncryptedFileBackend>(cfg.cacheDir, std::move(source)));
}

std::optional<CacheEntry> SessionCache::read(CacheBackend& backend, const std::string& profile) {
    auth::CredentialSet creds;
    try {
        auto payload = backend.load(profile);
        if (!payload) {
            return std::nullopt;
        }
        creds = deserializeEntry(profile, *payload);
    } catch (const core::CacheCorruptionError& e) {
        core::debug(cfg_, e.what());
        backend.remove(profile);
        core::info(cfg_, "Discarded unreadable cached credentials for '" + profile + "'");
        return std::nullopt;
    }

    if (!creds.validAt(clock_())) {
        core::debug(cfg_, "Cached credentials for '" + profile + "' expired");
        backend.remove(profile);
        return std::nullopt;
    }

    CacheEntry entry;
    entry.expiration = creds.expiration;
    entry.credentials = std::move(creds);
    entry.location = backend.location();
    return entry;
}

std::optional<CacheEntry> SessionCache::get(const std::string& profile) {
    if (auto hit = read(memory_, profile)) {
        return hit;
    }
    if (!persistent_) {
        return std::nullopt;
    }
    std::optional<CacheEntry> hit;
    try {
        hit = read(*persistent_, profile);
    } catch (const core::ConfigError& e) {
        // Unusable passphrase: run memory-only from here on
        core::info(cfg_, std::string("Persistent cache skipped: ") + e.what());
        persistent_.reset();
        return std::nullopt;
    }
    if (hit) {
        memory_.store(profile, serializeEntry(profile, hit->credentials, clock_()));
    }
    return hit;
}

void SessionCache::put(const std::string& profile, const auth::CredentialSet& creds) {
    if (!creds.isTemporary() && !cfg_.cacheStatic) {
        return;
    }
    std::string payload = serializeEntry(profile, creds, clock_());
    memory_.store(profile, payload);

    if (persistent_) {
        try {
            persistent_->store(profile, payload);
            core::debug(cfg_, "Cached credentials for '" + profile + "' in " +
                              locationName(persistent_->location()));
        } catch (const core::AuthCancelledError&) {
            throw;
        } catch (const std::exception& e) {
            core::warn(cfg_, std::string("Could not persist cached credentials: ") + e.what());
        }
    }
    crypto::wipe(payload);
}

void SessionCache::clear(const std::string& target) {
    bool all = target.empty() || target == "all";
    auto wipeFrom = [&](CacheBackend& backend) {
        if (all) {
            backend.removeAll();
        } else {
            backend.remove(target);
        }
    };

    wipeFrom(memory_);
    if (persistent_) {
        wipeFrom(*persistent_);
    }

    // File removal never needs the passphrase
    if (!persistent_ || persistent_->location() != CacheLocation::FILE) {
        EncryptedFileBackend files(cfg_.cacheDir, nullptr);
        wipeFrom(files);
    }
    if ((!persistent_ || persistent_->location() != CacheLocation::KEYCHAIN) && KeychainBackend::available(cfg_)) {
        KeychainBackend keychain(cfg_);
        wipeFrom(keychain);
    }
}

CacheLocation SessionCache::persistentLocation() const {
    return persistent_ ? persistent_->location() : CacheLocation::MEMORY;
}

} // namespace storage
} // namespace awx
