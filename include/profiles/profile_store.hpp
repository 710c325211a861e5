#pragma once

#include "core/config.hpp"
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace awx {
namespace profiles {

enum class Capability {
    SSO,
    ASSUME_ROLE,
    MFA,
    STATIC
};

std::string capabilityName(Capability cap);

// One named profile as merged from the config and credentials files
struct Profile {
    std::string name;
    std::optional<std::string> region;
    std::optional<std::string> ssoStartUrl;
    std::optional<std::string> ssoRegion;
    std::optional<std::string> ssoSession;
    std::optional<std::string> ssoAccountId;
    std::optional<std::string> ssoRoleName;
    std::optional<std::string> roleArn;
    std::optional<std::string> sourceProfile;
    std::optional<std::string> mfaSerial;
    std::optional<std::string> accessKeyId;
    std::optional<std::string> secretAccessKey;
    std::optional<std::string> sessionToken;
    std::optional<int> durationSeconds;
};

using ProfileMap = std::map<std::string, Profile>;
using CapabilitySet = std::set<Capability>;

// Pure and total over the attribute fields
CapabilitySet classify(const Profile& profile);

// [default][SSO][ROLE][MFA][STATIC]
std::string badges(const Profile& profile);

// explicit > environment default > "default"
std::string resolveProfileName(const std::optional<std::string>& explicitName,
                               const std::optional<std::string>& envDefault);

// Minimal INI reader: section -> key -> value. Throws ConfigError on an
// unterminated section header. Lines without '=' are reported through
// `malformedSections`.
using IniSections = std::map<std::string, std::map<std::string, std::string>>;
IniSections parseIni(std::istream& input, std::set<std::string>* malformedSections = nullptr);

class ProfileStore {
public:
    ProfileStore() = default;
    explicit ProfileStore(ProfileMap profiles);

    // Reads both files. Throws ConfigError if neither exists or one cannot
    // be read; malformed profiles are skipped and reported by warnings().
    static ProfileStore load(const std::string& configPath, const std::string& credentialsPath);
    static ProfileStore load(const core::Config& cfg);

    const ProfileMap& profiles() const { return profiles_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    std::vector<std::string> names() const;
    bool empty() const { return profiles_.empty(); }

    bool contains(const std::string& name) const;
    // Throws ProfileNotFoundError
    const Profile& get(const std::string& name) const;

    // Ordered base -> requested along source_profile links
    std::vector<const Profile*> resolveChain(const std::string& name) const;

private:
    ProfileMap profiles_;
    std::vector<std::string> warnings_;
};

} // namespace profiles
} // namespace awx
