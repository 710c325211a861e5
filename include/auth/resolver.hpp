#pragma once

#include "auth/credentials.hpp"
#include "auth/sts.hpp"
#include "core/config.hpp"
#include "profiles/profile_store.hpp"
#include "storage/cache.hpp"
#include <functional>
#include <optional>
#include <string>

namespace awx {
namespace auth {

enum class ResolveState {
    START,
    CLASSIFY,
    SSO_FLOW,
    MFA_FLOW,
    ASSUME_ROLE_FLOW,
    STATIC_FLOW,
    RESOLVED,
    FAILED
};

std::string stateName(ResolveState state);

constexpr int MAX_MFA_ATTEMPTS = 3;

// Per-invocation resolution inputs. Never persisted.
struct ResolutionContext {
    std::string profileName;
    bool interactive = true;
    std::optional<std::string> commandRegion;   // --region inside the wrapped command
    std::optional<std::string> envRegion;       // AWS_REGION, then AWS_DEFAULT_REGION
    int mfaAttempts = 0;                        // attempts used by the last MFA step
    std::string sessionName;                    // generated when empty
};

// awx-<unix-seconds>-<pid>
std::string makeSessionName();

// True for exactly six ASCII digits
bool isValidMfaCode(const std::string& code);

// The only way the resolver talks to a human
class Prompter {
public:
    virtual ~Prompter() = default;
    // No echo. Throws AuthCancelledError on interrupt or EOF.
    virtual std::string readSecret(const std::string& prompt) = 0;
    virtual void notify(const std::string& message) = 0;
};

class TerminalPrompter : public Prompter {
public:
    explicit TerminalPrompter(const core::Config& cfg) : cfg_(cfg) {}

    std::string readSecret(const std::string& prompt) override;
    void notify(const std::string& message) override;

private:
    const core::Config& cfg_;
};

class CredentialResolver {
public:
    using Clock = std::function<TimePoint()>;

    CredentialResolver(const core::Config& cfg, const profiles::ProfileStore& store, StsClient& sts,
                       Prompter& prompter, storage::SessionCache* cache = nullptr,
                       RetryPolicy retry = RetryPolicy(), Clock clock = std::chrono::system_clock::now);

    // Resolves ctx.profileName, consulting and refreshing the cache. The
    // region of the result follows: --region > environment > profile.
    CredentialSet resolve(ResolutionContext& ctx);

    ResolveState lastState() const { return state_; }

private:
    CredentialSet resolveUncached(const profiles::Profile& profile, ResolutionContext& ctx);
    CredentialSet resolveBase(const profiles::Profile& profile, ResolutionContext& ctx);
    CredentialSet ssoFlow(const profiles::Profile& profile, ResolutionContext& ctx);
    CredentialSet mfaFlow(const profiles::Profile& profile, ResolutionContext& ctx);
    CredentialSet assumeRoleFlow(const profiles::Profile& profile, ResolutionContext& ctx);
    CredentialSet staticFlow(const profiles::Profile& profile);

    // Prompts up to MAX_MFA_ATTEMPTS times; a malformed code or a rejected
    // call consumes an attempt.
    CredentialSet withMfaCode(const std::string& profile, const std::string& serial, ResolutionContext& ctx,
                              const std::function<CredentialSet(const MfaToken&)>& call);

    void enter(ResolveState state);

    const core::Config& cfg_;
    const profiles::ProfileStore& store_;
    StsClient& sts_;
    Prompter& prompter_;
    storage::SessionCache* cache_;
    RetryPolicy retry_;
    Clock clock_;
    ResolveState state_ = ResolveState::START;
    std::optional<std::string> mfaSatisfiedSerial_;
};

} // namespace auth
} // namespace awx
