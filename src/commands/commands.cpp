#include "commands/commands.hpp"
#include "auth/resolver.hpp"
#include "auth/sts.hpp"
#include "core/errors.hpp"
#include "storage/cache.hpp"
#include "system/launcher.hpp"
#include "system/system.hpp"
#include "ui/ui.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace awx {
namespace commands {

namespace {

constexpr int MAX_SELECTION_ATTEMPTS = 3;

profiles::ProfileStore loadProfiles(const core::Config& cfg)
{
    profiles::ProfileStore store = profiles::ProfileStore::load(cfg);
    for (const auto& warning : store.warnings()) {
        core::warn(cfg, warning);
    }
    return store;
}

std::optional<std::string> nonEmptyEnv(const char* key)
{
    std::string value = core::getenvs(key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string promptForProfile(const core::Config& cfg, const profiles::ProfileStore& store)
{
    std::vector<std::string> names = store.names();

    std::cerr << ui::colorize("Select a profile:", ui::Colors::BRIGHT_WHITE + ui::Colors::BOLD) << "\n";
    for (size_t i = 0; i < names.size(); ++i) {
        const auto& profile = store.get(names[i]);
        std::cerr << "  " << std::setw(2) << (i + 1) << ") "
                  << ui::colorize(names[i], ui::Colors::BRIGHT_CYAN) << " "
                  << ui::colorize(profiles::badges(profile), ui::Colors::DIM) << "\n";
    }

    bool hasDefault = store.contains("default");
    std::string prompt = "Profile [1-" + std::to_string(names.size()) + "]" +
                         (hasDefault ? " (Enter for default): " : ": ");

    for (int attempt = 0; attempt < MAX_SELECTION_ATTEMPTS; ++attempt) {
        std::string answer = core::trim(system::promptLine(prompt));
        if (answer.empty() && hasDefault) {
            return "default";
        }
        if (store.contains(answer)) {
            return answer;
        }
        try {
            size_t used = 0;
            int index = std::stoi(answer, &used);
            if (used == answer.size() && index >= 1 && static_cast<size_t>(index) <= names.size()) {
                return names[static_cast<size_t>(index) - 1];
            }
        } catch (const std::logic_error&) {
            // not a number; fall through to the retry message
        }
        core::warn(cfg, "Enter a number between 1 and " + std::to_string(names.size()));
    }
    throw core::ConfigError("No profile selected", "Pass -p NAME or set AWS_PROFILE");
}

} // namespace

std::string selectProfileName(const core::Config& cfg, const cli::Options& opts,
                              const profiles::ProfileStore& store) {
    auto envProfile = nonEmptyEnv("AWS_PROFILE");
    bool chosen = (opts.profile && !opts.profile->empty()) || envProfile;
    if (!chosen && cfg.interactive && system::stdinIsTerminal() && store.profiles().size() > 1) {
        return promptForProfile(cfg, store);
    }
    return profiles::resolveProfileName(opts.profile, envProfile);
}

int cmd_run(const core::Config& cfg, const cli::Options& opts) {
    if (opts.awsArgs.empty()) {
        throw core::ConfigError("No aws command given", "Example: awx -p NAME s3 ls");
    }

    profiles::ProfileStore store = loadProfiles(cfg);
    if (store.empty()) {
        throw core::ConfigError("No profiles found in " + cfg.awsConfigFile + " or " + cfg.awsCredentialsFile,
                                "Run 'aws configure' or 'aws configure sso' to create one");
    }

    std::string profileName = selectProfileName(cfg, opts, store);
    const profiles::Profile& profile = store.get(profileName);
    core::debug(cfg, "Profile '" + profile.name + "' " + profiles::badges(profile));

    system::ProcessLauncher launcher(cfg);
    launcher.locate();

    auto cache = storage::SessionCache::fromConfig(cfg);
    auth::AwsCliStsClient sts(cfg);
    auth::TerminalPrompter prompter(cfg);
    auth::CredentialResolver resolver(cfg, store, sts, prompter, cache.get());

    auth::ResolutionContext ctx;
    ctx.profileName = profile.name;
    ctx.interactive = cfg.interactive;
    ctx.commandRegion = system::optionValue(opts.awsArgs, "--region");
    ctx.envRegion = nonEmptyEnv("AWS_REGION");
    if (!ctx.envRegion) {
        ctx.envRegion = nonEmptyEnv("AWS_DEFAULT_REGION");
    }

    auth::CredentialSet creds = resolver.resolve(ctx);
    if (creds.expiration) {
        core::debug(cfg, "Credentials for '" + profile.name + "' valid until " + core::formatTimeUTC(*creds.expiration));
    } else {
        core::debug(cfg, "Static credentials for '" + profile.name + "' (" + core::maskValue(creds.accessKeyId) + ")");
    }

    return launcher.run(creds, profile.name, opts.awsArgs);
}

int cmd_config(const core::Config& cfg, const cli::Options& opts) {
    profiles::ProfileStore store = loadProfiles(cfg);
    std::string active = profiles::resolveProfileName(opts.profile, nonEmptyEnv("AWS_PROFILE"));

    std::cout << ui::colorize("AWS profiles", ui::Colors::BRIGHT_WHITE + ui::Colors::BOLD) << "\n";
    std::cout << ui::colorize("  config:      " + cfg.awsConfigFile, ui::Colors::DIM) << "\n";
    std::cout << ui::colorize("  credentials: " + cfg.awsCredentialsFile, ui::Colors::DIM) << "\n\n";

    if (store.empty()) {
        std::cout << "  (no profiles)\n";
        return 0;
    }

    size_t width = 0;
    for (const auto& name : store.names()) {
        width = std::max(width, name.size());
    }

    for (const auto& [name, profile] : store.profiles()) {
        std::string marker = name == active ? "*" : " ";
        std::ostringstream line;
        line << std::left << std::setw(static_cast<int>(width)) << name;
        std::cout << " " << marker << " " << ui::colorize(line.str(), ui::Colors::BRIGHT_CYAN)
                  << "  " << profiles::badges(profile);
        if (profile.region) {
            std::cout << ui::colorize("  " + *profile.region, ui::Colors::DIM);
        }
        if (profile.roleArn) {
            std::cout << ui::colorize("  " + core::maskArn(*profile.roleArn), ui::Colors::DIM);
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_clear_cache(const core::Config& cfg, const cli::Options& opts) {
    std::string target = opts.clearCache.value_or("all");
    storage::SessionCache cache(cfg);
    cache.clear(target);
    if (target == "all") {
        core::ok(cfg, "Cleared all cached sessions");
    } else {
        core::ok(cfg, "Cleared cached session for '" + target + "'");
    }
    return 0;
}

int cmd_version(const core::Config& /* cfg */, const cli::Options& /* opts */) {
    cli::showVersion();
    return 0;
}

int cmd_help(const core::Config& /* cfg */, const cli::Options& /* opts */) {
    cli::cmd_help();
    return 0;
}

} // namespace commands
} // namespace awx
