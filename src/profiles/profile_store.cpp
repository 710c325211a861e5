#include "profiles/profile_store.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace awx {
namespace profiles {

namespace fs = std::filesystem;

namespace {

// Returns an empty string on success, otherwise why the value is rejected
std::string applyAttribute(Profile& profile, const std::string& key, const std::string& value)
{
    if (key == "region") {
        profile.region = value;
    } else if (key == "sso_start_url") {
        profile.ssoStartUrl = value;
    } else if (key == "sso_region") {
        profile.ssoRegion = value;
    } else if (key == "sso_session") {
        profile.ssoSession = value;
    } else if (key == "sso_account_id") {
        profile.ssoAccountId = value;
    } else if (key == "sso_role_name") {
        profile.ssoRoleName = value;
    } else if (key == "role_arn") {
        if (!core::startsWith(value, "arn:")) {
            return "role_arn is not an ARN";
        }
        profile.roleArn = value;
    } else if (key == "source_profile") {
        if (value.empty()) {
            return "source_profile is empty";
        }
        profile.sourceProfile = value;
    } else if (key == "mfa_serial") {
        profile.mfaSerial = value;
    } else if (key == "aws_access_key_id") {
        profile.accessKeyId = value;
    } else if (key == "aws_secret_access_key") {
        profile.secretAccessKey = value;
    } else if (key == "aws_session_token") {
        profile.sessionToken = value;
    } else if (key == "duration_seconds") {
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                [](unsigned char c) { return std::isdigit(c); }) || value.size() > 6) {
            return "duration_seconds is not a number";
        }
        profile.durationSeconds = std::stoi(value);
    }
    return "";
}

IniSections readIniFile(const std::string& path, std::set<std::string>& malformed)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw core::ConfigError("Failed to read " + path, "Check the file permissions");
    }
    try {
        return parseIni(in, &malformed);
    } catch (const core::ConfigError& e) {
        throw core::ConfigError(path + ": " + e.what(), e.hint());
    }
}

// Maps a config-file section to a profile name; empty when the section is
// not a profile.
std::optional<std::string> configSectionProfile(const std::string& section)
{
    if (section == "default") {
        return section;
    }
    if (core::startsWith(section, "profile ")) {
        return core::trim(section.substr(8));
    }
    if (core::startsWith(section, "sso-session ") || core::startsWith(section, "services ")) {
        return std::nullopt;
    }
    return section;
}

} // namespace

std::string capabilityName(Capability cap) {
    switch (cap) {
        case Capability::SSO: return "SSO";
        case Capability::ASSUME_ROLE: return "ROLE";
        case Capability::MFA: return "MFA";
        case Capability::STATIC: return "STATIC";
    }
    return "UNKNOWN";
}

CapabilitySet classify(const Profile& profile) {
    CapabilitySet caps;
    if (profile.ssoStartUrl || profile.ssoRegion || profile.ssoSession) {
        caps.insert(Capability::SSO);
    }
    if (profile.roleArn) {
        caps.insert(Capability::ASSUME_ROLE);
    }
    if (profile.mfaSerial) {
        caps.insert(Capability::MFA);
    }
    if (profile.accessKeyId && profile.secretAccessKey) {
        caps.insert(Capability::STATIC);
    }
    return caps;
}

std::string badges(const Profile& profile) {
    std::string out;
    if (profile.name == "default") {
        out += "[default]";
    }
    // Capability order follows the enum: SSO, ROLE, MFA, STATIC
    for (Capability cap : classify(profile)) {
        out += "[" + capabilityName(cap) + "]";
    }
    return out;
}

std::string resolveProfileName(const std::optional<std::string>& explicitName,
                               const std::optional<std::string>& envDefault) {
    if (explicitName && !explicitName->empty()) {
        return *explicitName;
    }
    if (envDefault && !envDefault->empty()) {
        return *envDefault;
    }
    return "default";
}

IniSections parseIni(std::istream& input, std::set<std::string>* malformedSections) {
    IniSections sections;
    std::string current = "default";
    std::string raw;
    size_t lineNo = 0;

    while (std::getline(input, raw)) {
        ++lineNo;
        std::string line = core::trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                throw core::ConfigError("Unterminated section header on line " + std::to_string(lineNo));
            }
            current = core::trim(line.substr(1, line.size() - 2));
            sections[current];
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            if (malformedSections) {
                malformedSections->insert(current);
            }
            continue;
        }

        std::string key = core::trim(line.substr(0, eq));
        std::string value = core::trim(line.substr(eq + 1));
        sections[current][key] = value;
    }

    return sections;
}

ProfileStore::ProfileStore(ProfileMap profiles)
    : profiles_(std::move(profiles)) {}

ProfileStore ProfileStore::load(const core::Config& cfg) {
    return load(cfg.awsConfigFile, cfg.awsCredentialsFile);
}

ProfileStore ProfileStore::load(const std::string& configPath, const std::string& credentialsPath) {
    std::error_code ec;
    bool haveConfig = fs::exists(configPath, ec);
    bool haveCredentials = fs::exists(credentialsPath, ec);
    if (!haveConfig && !haveCredentials) {
        throw core::ConfigError("No AWS configuration found at " + configPath + " or " + credentialsPath,
                                "Run 'aws configure' or 'aws configure sso' to create a profile");
    }

    ProfileStore store;
    std::map<std::string, std::string> rejected;

    auto merge = [&](const std::string& name, const std::map<std::string, std::string>& props) {
        if (name.empty()) {
            store.warnings_.push_back("Skipping section with an empty profile name");
            return;
        }
        Profile& profile = store.profiles_[name];
        profile.name = name;
        for (const auto& [key, value] : props) {
            std::string problem = applyAttribute(profile, key, value);
            if (!problem.empty() && !rejected.count(name)) {
                rejected[name] = problem;
            }
        }
    };

    if (haveConfig) {
        std::set<std::string> malformed;
        IniSections sections = readIniFile(configPath, malformed);
        for (const auto& [section, props] : sections) {
            auto name = configSectionProfile(section);
            if (!name) {
                continue;
            }
            if (malformed.count(section)) {
                rejected.emplace(*name, "line without '=' in " + configPath);
            }
            merge(*name, props);
        }
    }

    if (haveCredentials) {
        std::set<std::string> malformed;
        IniSections sections = readIniFile(credentialsPath, malformed);
        for (const auto& [section, props] : sections) {
            if (malformed.count(section)) {
                rejected.emplace(section, "line without '=' in " + credentialsPath);
            }
            merge(section, props);
        }
    }

    for (const auto& [name, reason] : rejected) {
        store.profiles_.erase(name);
        store.warnings_.push_back("Skipping malformed profile '" + name + "': " + reason);
    }

    return store;
}

std::vector<std::string> ProfileStore::names() const {
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        out.push_back(entry.first);
    }
    return out;
}

bool ProfileStore::contains(const std::string& name) const {
    return profiles_.find(name) != profiles_.end();
}

const Profile& ProfileStore::get(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        throw core::ProfileNotFoundError(name);
    }
    return it->second;
}

std::vector<const Profile*> ProfileStore::resolveChain(const std::string& name) const {
    std::vector<const Profile*> chain;
    std::set<std::string> visited;
    const Profile* current = &get(name);

    while (true) {
        if (!visited.insert(current->name).second) {
            std::string path;
            for (auto it = chain.begin(); it != chain.end(); ++it) {
                path += (*it)->name + " -> ";
            }
            throw core::CircularReferenceError(path + current->name);
        }
        chain.push_back(current);

        if (!current->roleArn) {
            break;
        }
        if (!current->sourceProfile) {
            throw core::IncompleteProfileError(current->name, "role_arn is set but source_profile is missing");
        }
        auto it = profiles_.find(*current->sourceProfile);
        if (it == profiles_.end()) {
            throw core::MissingSourceProfileError(current->name, *current->sourceProfile);
        }
        current = &it->second;
    }

    std::reverse(chain.begin(), chain.end());
    return chain;
}

} // namespace profiles
} // namespace awx
