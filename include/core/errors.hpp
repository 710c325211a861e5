#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace awx {
namespace core {

// Exit codes shared by every command
namespace ExitCode {
    constexpr int OK = 0;
    constexpr int INTERNAL = 1;
    constexpr int AUTH_REQUIRED = 2;
    constexpr int MFA_EXHAUSTED = 3;
    constexpr int CANCELLED = 4;
    constexpr int NOT_FOUND = 127;
    constexpr int SIGNAL_BASE = 128;
}

// Base of every error that is allowed to reach the user. Carries the exit
// status and a one-line remediation hint. Messages never contain secrets.
class AwxError : public std::runtime_error {
public:
    AwxError(const std::string& msg, int exitCode, std::string hint = "")
        : std::runtime_error(msg), exitCode_(exitCode), hint_(std::move(hint)) {}

    int exitCode() const noexcept { return exitCode_; }
    const std::string& hint() const noexcept { return hint_; }

private:
    int exitCode_;
    std::string hint_;
};

class ConfigError : public AwxError {
public:
    explicit ConfigError(const std::string& msg, std::string hint = "")
        : AwxError(msg, ExitCode::INTERNAL, std::move(hint)) {}
};

// Profile graph defects
class ProfileReferenceError : public AwxError {
public:
    ProfileReferenceError(const std::string& msg, std::string hint = "")
        : AwxError(msg, ExitCode::AUTH_REQUIRED, std::move(hint)) {}
};

class ProfileNotFoundError : public ProfileReferenceError {
public:
    explicit ProfileNotFoundError(const std::string& profile)
        : ProfileReferenceError("Profile '" + profile + "' not found",
                                "Run 'awx --config' to list the available profiles") {}
};

class MissingSourceProfileError : public ProfileReferenceError {
public:
    MissingSourceProfileError(const std::string& profile, const std::string& source)
        : ProfileReferenceError("source_profile '" + source + "' referenced by '" + profile + "' not found",
                                "Define [profile " + source + "] or fix source_profile in '" + profile + "'") {}
};

class CircularReferenceError : public ProfileReferenceError {
public:
    explicit CircularReferenceError(const std::string& chain)
        : ProfileReferenceError("Circular source_profile reference: " + chain,
                                "Break the cycle so the chain ends at a profile with SSO or static keys") {}
};

class IncompleteProfileError : public ProfileReferenceError {
public:
    IncompleteProfileError(const std::string& profile, const std::string& missing)
        : ProfileReferenceError("Profile '" + profile + "' is incomplete: " + missing) {}
};

// An interactive step is needed but prompts are disabled
class AuthRequiredError : public AwxError {
public:
    AuthRequiredError(const std::string& msg, const std::string& command)
        : AwxError(msg + ". Run: " + command, ExitCode::AUTH_REQUIRED), command_(command) {}

    const std::string& command() const noexcept { return command_; }

private:
    std::string command_;
};

class MfaExhaustedError : public AwxError {
public:
    MfaExhaustedError(const std::string& profile, int attempts)
        : AwxError("MFA failed " + std::to_string(attempts) + " times for profile '" + profile + "'",
                   ExitCode::MFA_EXHAUSTED, "Check the device clock and the mfa_serial of the profile") {}
};

class AuthCancelledError : public AwxError {
public:
    AuthCancelledError()
        : AwxError("Authentication cancelled", ExitCode::CANCELLED) {}
};

// Non-transient rejection from an external call
class AuthFailedError : public AwxError {
public:
    explicit AuthFailedError(const std::string& msg, std::string hint = "")
        : AwxError(msg, ExitCode::INTERNAL, std::move(hint)) {}
};

// Rejected one-time code; the only failure that consumes an MFA attempt
class InvalidMfaCodeError : public AuthFailedError {
public:
    explicit InvalidMfaCodeError(const std::string& msg)
        : AuthFailedError(msg, "Wait for the next code and try again") {}
};

class TransientNetworkError : public AwxError {
public:
    explicit TransientNetworkError(const std::string& msg)
        : AwxError(msg, ExitCode::INTERNAL, "Check network connectivity or raise AWX_REQUEST_TIMEOUT") {}
};

// Recovered inside the cache; never reaches main
class CacheCorruptionError : public AwxError {
public:
    explicit CacheCorruptionError(const std::string& msg)
        : AwxError(msg, ExitCode::INTERNAL) {}
};

class ExecutableNotFoundError : public AwxError {
public:
    explicit ExecutableNotFoundError(const std::string& name)
        : AwxError("Executable '" + name + "' not found", ExitCode::NOT_FOUND,
                   "Install AWS CLI v2 and make sure it is on PATH, or set AWX_AWS_BINARY") {}
};

} // namespace core
} // namespace awx
