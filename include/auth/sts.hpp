#pragma once

#include "auth/credentials.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "system/system.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace awx {
namespace auth {

enum class ProbeResult {
    VALID,
    INVALID,
    TIMED_OUT
};

struct MfaToken {
    std::string serial;
    std::string code;
};

// Boundary to the provider's STS/SSO operations. Every call either returns
// a result or throws AuthFailedError / TransientNetworkError.
class StsClient {
public:
    virtual ~StsClient() = default;

    // Cheap validity check of the SSO session cached by the aws CLI
    virtual ProbeResult probeIdentity(const std::string& profile) = 0;

    // Account id the given credentials belong to
    virtual std::string callerAccount(const CredentialSet& base) = 0;

    // Credentials of an already valid SSO session
    virtual CredentialSet exportSsoCredentials(const std::string& profile) = 0;

    // Interactive browser/device login, stdio inherited
    virtual void ssoLogin(const std::string& profile) = 0;

    virtual CredentialSet getSessionToken(const CredentialSet& base, const MfaToken& mfa,
                                          int durationSeconds) = 0;

    virtual CredentialSet assumeRole(const CredentialSet& base, const std::string& roleArn,
                                     const std::string& sessionName, int durationSeconds,
                                     const std::optional<MfaToken>& mfa) = 0;
};

// Drives the aws binary as a subprocess
class AwsCliStsClient : public StsClient {
public:
    explicit AwsCliStsClient(const core::Config& cfg);

    ProbeResult probeIdentity(const std::string& profile) override;
    std::string callerAccount(const CredentialSet& base) override;
    CredentialSet exportSsoCredentials(const std::string& profile) override;
    void ssoLogin(const std::string& profile) override;
    CredentialSet getSessionToken(const CredentialSet& base, const MfaToken& mfa,
                                  int durationSeconds) override;
    CredentialSet assumeRole(const CredentialSet& base, const std::string& roleArn,
                             const std::string& sessionName, int durationSeconds,
                             const std::optional<MfaToken>& mfa) override;

private:
    system::ProcessResult invoke(const std::vector<std::string>& args, const system::Environment& env,
                                 std::chrono::milliseconds timeout);
    system::Environment credentialEnvironment(const CredentialSet& base) const;
    system::Environment profileEnvironment(const std::string& profile) const;
    const std::string& binary();

    const core::Config& cfg_;
    std::string binaryPath_;
};

// Bounded exponential backoff for transient failures
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{300};
    double factor = 2.3;
    std::function<void(std::chrono::milliseconds)> sleeper;

    // Delay before retry number `attempt` (1-based), jitter in [0, delay/2)
    std::chrono::milliseconds delayFor(int attempt, std::mt19937& rng) const;
};

// Runs `call`, retrying only TransientNetworkError. The last transient error
// is rethrown once attempts are exhausted.
template <typename Fn>
auto retryTransient(const RetryPolicy& policy, Fn&& call) -> decltype(call()) {
    std::mt19937 rng(std::random_device{}());
    for (int attempt = 1;; ++attempt) {
        try {
            return call();
        } catch (const core::TransientNetworkError&) {
            if (attempt >= policy.maxAttempts) {
                throw;
            }
        }
        auto delay = policy.delayFor(attempt, rng);
        if (policy.sleeper) {
            policy.sleeper(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

// Failure classification for aws CLI stderr. The raw text never leaves
// this module.
enum class FailureKind {
    TRANSIENT,
    ACCESS_DENIED,
    INVALID_MFA,
    EXPIRED_TOKEN,
    INVALID_CLIENT_TOKEN,
    MALFORMED_INPUT,
    SSO_SESSION,
    OTHER
};

FailureKind classifyFailure(const std::string& stderrText);
std::string describeFailure(FailureKind kind);

// Flat "key": "value" / number extraction from aws JSON output. Nested
// objects are walked; later duplicates overwrite earlier ones.
std::map<std::string, std::string> parseJsonFields(const std::string& text);

// Credentials from a get-session-token / assume-role response
// ({"Credentials": {...}}) or from export-credentials process output.
CredentialSet parseCredentialsJson(const std::string& text);

// "123456789012" from arn:aws:iam::123456789012:mfa/name
std::optional<std::string> accountFromArn(const std::string& arn);

} // namespace auth
} // namespace awx
