#include "auth/resolver.hpp"
#include "core/errors.hpp"
#include "system/system.hpp"
#include <algorithm>
#include <cctype>
#include <unistd.h>

namespace awx {
namespace auth {

namespace {

CredentialSet staticCredentials(const profiles::Profile& profile)
{
    if (!profile.accessKeyId || !profile.secretAccessKey) {
        throw core::IncompleteProfileError(profile.name,
                                           "aws_access_key_id and aws_secret_access_key are required");
    }
    CredentialSet creds;
    creds.accessKeyId = *profile.accessKeyId;
    creds.secretAccessKey = *profile.secretAccessKey;
    creds.sessionToken = profile.sessionToken;
    return creds;
}

std::string attemptSuffix(int attempt)
{
    return " (attempt " + std::to_string(attempt) + " of " + std::to_string(MAX_MFA_ATTEMPTS) + ")";
}

} // namespace

std::string stateName(ResolveState state) {
    switch (state) {
        case ResolveState::START: return "Start";
        case ResolveState::CLASSIFY: return "Classify";
        case ResolveState::SSO_FLOW: return "SsoFlow";
        case ResolveState::MFA_FLOW: return "MfaFlow";
        case ResolveState::ASSUME_ROLE_FLOW: return "AssumeRoleFlow";
        case ResolveState::STATIC_FLOW: return "StaticFlow";
        case ResolveState::RESOLVED: return "Resolved";
        case ResolveState::FAILED: return "Failed";
    }
    return "Unknown";
}

std::string makeSessionName() {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "awx-" + std::to_string(secs) + "-" + std::to_string(::getpid());
}

bool isValidMfaCode(const std::string& code) {
    return code.size() == 6 &&
           std::all_of(code.begin(), code.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

// TerminalPrompter
std::string TerminalPrompter::readSecret(const std::string& prompt) {
    return system::promptSecret(prompt);
}

void TerminalPrompter::notify(const std::string& message) {
    core::info(cfg_, message);
}

// CredentialResolver
CredentialResolver::CredentialResolver(const core::Config& cfg, const profiles::ProfileStore& store,
                                       StsClient& sts, Prompter& prompter, storage::SessionCache* cache,
                                       RetryPolicy retry, Clock clock)
    : cfg_(cfg), store_(store), sts_(sts), prompter_(prompter), cache_(cache),
      retry_(std::move(retry)), clock_(std::move(clock)) {}

void CredentialResolver::enter(ResolveState state) {
    state_ = state;
    core::debug(cfg_, "resolver: " + stateName(state));
}

CredentialSet CredentialResolver::resolve(ResolutionContext& ctx) {
    enter(ResolveState::START);
    mfaSatisfiedSerial_.reset();

    try {
        const profiles::Profile& profile = store_.get(ctx.profileName);
        if (ctx.sessionName.empty()) {
            ctx.sessionName = makeSessionName();
        }

        CredentialSet creds;
        std::optional<storage::CacheEntry> hit;
        if (cache_) {
            hit = cache_->get(profile.name);
        }

        if (hit && hit->credentials.validAt(clock_())) {
            core::debug(cfg_, "Using cached credentials for '" + profile.name + "' from " +
                              storage::locationName(hit->location));
            creds = hit->credentials;
        } else {
            creds = resolveUncached(profile, ctx);
            creds.region = profile.region;
            if (cache_) {
                cache_->put(profile.name, creds);
            }
        }

        if (ctx.commandRegion) {
            creds.region = ctx.commandRegion;
        } else if (ctx.envRegion) {
            creds.region = ctx.envRegion;
        } else if (profile.region) {
            creds.region = profile.region;
        }

        enter(ResolveState::RESOLVED);
        return creds;
    } catch (const std::exception&) {
        enter(ResolveState::FAILED);
        throw;
    }
}

CredentialSet CredentialResolver::resolveUncached(const profiles::Profile& profile, ResolutionContext& ctx) {
    enter(ResolveState::CLASSIFY);
    auto caps = profiles::classify(profile);
    core::debug(cfg_, "Profile '" + profile.name + "' " + profiles::badges(profile));

    if (caps.count(profiles::Capability::ASSUME_ROLE)) {
        return assumeRoleFlow(profile, ctx);
    }
    return resolveBase(profile, ctx);
}

CredentialSet CredentialResolver::resolveBase(const profiles::Profile& profile, ResolutionContext& ctx) {
    auto caps = profiles::classify(profile);
    if (caps.count(profiles::Capability::SSO)) {
        return ssoFlow(profile, ctx);
    }
    if (caps.count(profiles::Capability::MFA)) {
        return mfaFlow(profile, ctx);
    }
    if (caps.count(profiles::Capability::STATIC)) {
        return staticFlow(profile);
    }
    throw core::IncompleteProfileError(profile.name, "no SSO settings, static keys or role_arn");
}

CredentialSet CredentialResolver::ssoFlow(const profiles::Profile& profile, ResolutionContext& ctx) {
    enter(ResolveState::SSO_FLOW);
    const std::string& name = profile.name;

    ProbeResult probe = sts_.probeIdentity(name);
    if (probe == ProbeResult::TIMED_OUT) {
        core::debug(cfg_, "SSO probe for '" + name + "' timed out");
    }

    if (probe != ProbeResult::VALID) {
        if (!ctx.interactive) {
            throw core::AuthRequiredError("SSO login required for profile \"" + name + "\"",
                                          "aws sso login --profile " + name);
        }
        prompter_.notify("SSO session for '" + name + "' is missing or expired. Running: aws sso login --profile " + name);
        sts_.ssoLogin(name);
        if (sts_.probeIdentity(name) != ProbeResult::VALID) {
            throw core::AuthFailedError("SSO session for profile '" + name + "' is still invalid after login",
                                        "Check sso_start_url and sso_region, then run 'aws sso login --profile " +
                                        name + "'");
        }
    }

    return retryTransient(retry_, [&]() { return sts_.exportSsoCredentials(name); });
}

CredentialSet CredentialResolver::mfaFlow(const profiles::Profile& profile, ResolutionContext& ctx) {
    enter(ResolveState::MFA_FLOW);
    const std::string& name = profile.name;
    if (!profile.accessKeyId || !profile.secretAccessKey) {
        throw core::IncompleteProfileError(name, "mfa_serial requires aws_access_key_id and aws_secret_access_key");
    }
    if (!ctx.interactive) {
        throw core::AuthRequiredError("MFA code required for profile \"" + name + "\"",
                                      "aws sts get-session-token --profile " + name +
                                      " --serial-number <MFA_SERIAL> --token-code <CODE>");
    }

    const std::string& serial = *profile.mfaSerial;
    CredentialSet base = staticCredentials(profile);

    if (auto deviceAccount = accountFromArn(serial)) {
        try {
            std::string keyAccount = retryTransient(retry_, [&]() { return sts_.callerAccount(base); });
            if (keyAccount != *deviceAccount) {
                throw core::ConfigError("mfa_serial of '" + name + "' belongs to account " + *deviceAccount +
                                        " but its access keys belong to account " + keyAccount,
                                        "Fix mfa_serial or the access keys of the profile");
            }
        } catch (const core::AuthFailedError& e) {
            core::warn(cfg_, std::string("Could not verify the MFA device account: ") + e.what());
        } catch (const core::TransientNetworkError& e) {
            core::warn(cfg_, std::string("Could not verify the MFA device account: ") + e.what());
        }
    }

    int duration = cfg_.sessionDurationSeconds;
    CredentialSet creds = withMfaCode(name, serial, ctx, [&](const MfaToken& token) {
        return retryTransient(retry_, [&]() { return sts_.getSessionToken(base, token, duration); });
    });
    mfaSatisfiedSerial_ = serial;
    return creds;
}

CredentialSet CredentialResolver::assumeRoleFlow(const profiles::Profile& profile, ResolutionContext& ctx) {
    enter(ResolveState::ASSUME_ROLE_FLOW);
    auto chain = store_.resolveChain(profile.name);

    CredentialSet creds = resolveBase(*chain.front(), ctx);

    for (size_t i = 1; i < chain.size(); ++i) {
        const profiles::Profile& role = *chain[i];
        enter(ResolveState::ASSUME_ROLE_FLOW);
        core::debug(cfg_, "Assuming " + core::maskArn(*role.roleArn) + " for '" + role.name + "'");

        int duration = role.durationSeconds.value_or(cfg_.sessionDurationSeconds);
        auto assume = [&](const std::optional<MfaToken>& mfa) {
            return retryTransient(retry_, [&]() {
                return sts_.assumeRole(creds, *role.roleArn, ctx.sessionName, duration, mfa);
            });
        };

        // A session already obtained with the same device satisfies the role's MFA condition
        bool needsMfa = role.mfaSerial && mfaSatisfiedSerial_ != role.mfaSerial;
        if (!needsMfa) {
            creds = assume(std::nullopt);
            continue;
        }

        if (!ctx.interactive) {
            throw core::AuthRequiredError("MFA code required to assume the role of profile \"" + role.name + "\"",
                                          "aws sts assume-role --profile " + chain[i - 1]->name +
                                          " --role-arn <ROLE_ARN> --role-session-name " + ctx.sessionName +
                                          " --serial-number <MFA_SERIAL> --token-code <CODE>");
        }
        creds = withMfaCode(role.name, *role.mfaSerial, ctx, [&](const MfaToken& token) {
            return assume(token);
        });
        mfaSatisfiedSerial_ = role.mfaSerial;
    }

    return creds;
}

CredentialSet CredentialResolver::staticFlow(const profiles::Profile& profile) {
    enter(ResolveState::STATIC_FLOW);
    return staticCredentials(profile);
}

CredentialSet CredentialResolver::withMfaCode(const std::string& profile, const std::string& serial,
                                              ResolutionContext& ctx,
                                              const std::function<CredentialSet(const MfaToken&)>& call) {
    ctx.mfaAttempts = 0;
    while (ctx.mfaAttempts < MAX_MFA_ATTEMPTS) {
        int attempt = ++ctx.mfaAttempts;
        std::string code = core::trim(prompter_.readSecret(
            "MFA code for '" + profile + "' (" + core::maskArn(serial) + "): "));

        if (!isValidMfaCode(code)) {
            prompter_.notify("MFA code must be 6 digits" + attemptSuffix(attempt));
            continue;
        }

        try {
            return call(MfaToken{serial, code});
        } catch (const core::InvalidMfaCodeError& e) {
            prompter_.notify(e.what() + attemptSuffix(attempt));
        }
    }
    throw core::MfaExhaustedError(profile, MAX_MFA_ATTEMPTS);
}

} // namespace auth
} // namespace awx
