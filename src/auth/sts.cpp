#include "auth/sts.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace awx {
namespace auth {

namespace {

const std::vector<std::string> CREDENTIAL_VARS = {
    "AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN", "AWS_SECURITY_TOKEN"
};

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles)
{
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string readJsonString(const std::string& txt, size_t& i)
{
    // txt[i] is the opening quote
    std::string out;
    for (++i; i < txt.size(); ++i) {
        char c = txt[i];
        if (c == '"') {
            ++i;
            return out;
        }
        if (c == '\\' && i + 1 < txt.size()) {
            char e = txt[++i];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u':
                    // aws output only escapes ASCII this way
                    if (i + 4 < txt.size()) {
                        out.push_back(static_cast<char>(std::strtol(txt.substr(i + 1, 4).c_str(), nullptr, 16) & 0x7f));
                        i += 4;
                    }
                    break;
                default: out.push_back(e); break;
            }
            continue;
        }
        out.push_back(c);
    }
    return out;
}

void skipSpace(const std::string& txt, size_t& i)
{
    while (i < txt.size() && std::isspace(static_cast<unsigned char>(txt[i]))) {
        ++i;
    }
}

// Raises the error matching a failed aws invocation
[[noreturn]] void throwFailure(const std::string& operation, const system::ProcessResult& result)
{
    if (result.timedOut) {
        throw core::TransientNetworkError(operation + " timed out");
    }
    FailureKind kind = classifyFailure(result.err);
    std::string msg = operation + " failed: " + describeFailure(kind);
    switch (kind) {
        case FailureKind::TRANSIENT:
            throw core::TransientNetworkError(msg);
        case FailureKind::INVALID_MFA:
            throw core::InvalidMfaCodeError(msg);
        case FailureKind::EXPIRED_TOKEN:
        case FailureKind::SSO_SESSION:
            throw core::AuthFailedError(msg, "Log in again and retry");
        case FailureKind::INVALID_CLIENT_TOKEN:
            throw core::AuthFailedError(msg, "Check aws_access_key_id and aws_secret_access_key of the source profile");
        case FailureKind::MALFORMED_INPUT:
            throw core::AuthFailedError(msg, "Check role_arn, mfa_serial and duration_seconds of the profile");
        case FailureKind::ACCESS_DENIED:
            throw core::AuthFailedError(msg, "Check the trust policy and permissions of the role");
        case FailureKind::OTHER:
            break;
    }
    throw core::AuthFailedError(msg, "Re-run with --verbose for more detail");
}

} // namespace

// Failure classification
FailureKind classifyFailure(const std::string& stderrText) {
    std::string text = core::toLower(stderrText);

    if (containsAny(text, {"could not connect to the endpoint", "connect timeout", "read timeout",
                           "timed out", "name or service not known", "temporary failure in name resolution",
                           "nodename nor servname", "connection was closed", "connection reset",
                           "throttl", "rate exceeded", "requestlimitexceeded", "serviceunavailable",
                           "service unavailable"})) {
        return FailureKind::TRANSIENT;
    }
    if (containsAny(text, {"multifactorauthentication", "invalid mfa", "mfa one time pass code"})) {
        return FailureKind::INVALID_MFA;
    }
    if (containsAny(text, {"sso session", "error loading sso token", "sso token", "refresh failed"})) {
        return FailureKind::SSO_SESSION;
    }
    if (containsAny(text, {"expiredtoken", "token has expired", "token included in the request is expired"})) {
        return FailureKind::EXPIRED_TOKEN;
    }
    if (containsAny(text, {"invalidclienttokenid", "signaturedoesnotmatch", "unable to locate credentials"})) {
        return FailureKind::INVALID_CLIENT_TOKEN;
    }
    if (containsAny(text, {"validationerror", "parameter validation failed", "malformed", "invalid length",
                           "not a valid arn"})) {
        return FailureKind::MALFORMED_INPUT;
    }
    if (containsAny(text, {"accessdenied", "access denied", "not authorized"})) {
        return FailureKind::ACCESS_DENIED;
    }
    return FailureKind::OTHER;
}

std::string describeFailure(FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSIENT: return "network or throttling error";
        case FailureKind::ACCESS_DENIED: return "access denied";
        case FailureKind::INVALID_MFA: return "invalid MFA code";
        case FailureKind::EXPIRED_TOKEN: return "expired token";
        case FailureKind::INVALID_CLIENT_TOKEN: return "invalid or unknown credentials";
        case FailureKind::MALFORMED_INPUT: return "malformed request";
        case FailureKind::SSO_SESSION: return "SSO session invalid or expired";
        case FailureKind::OTHER: break;
    }
    return "unexpected error";
}

// JSON helpers
std::map<std::string, std::string> parseJsonFields(const std::string& txt) {
    std::map<std::string, std::string> fields;
    size_t i = 0;
    while (i < txt.size()) {
        if (txt[i] != '"') {
            ++i;
            continue;
        }
        std::string key = readJsonString(txt, i);
        skipSpace(txt, i);
        if (i >= txt.size() || txt[i] != ':') {
            continue; // an array element or a value already consumed
        }
        ++i;
        skipSpace(txt, i);
        if (i >= txt.size()) {
            break;
        }
        if (txt[i] == '"') {
            fields[key] = readJsonString(txt, i);
        } else if (txt[i] == '{' || txt[i] == '[') {
            ++i; // descend
        } else {
            size_t end = i;
            while (end < txt.size() && txt[end] != ',' && txt[end] != '}' && txt[end] != ']'
                   && !std::isspace(static_cast<unsigned char>(txt[end]))) {
                ++end;
            }
            fields[key] = txt.substr(i, end - i);
            i = end;
        }
    }
    return fields;
}

CredentialSet parseCredentialsJson(const std::string& text) {
    auto fields = parseJsonFields(text);
    auto field = [&](const char* name) -> std::optional<std::string> {
        auto it = fields.find(name);
        if (it == fields.end() || it->second.empty() || it->second == "null") {
            return std::nullopt;
        }
        return it->second;
    };

    auto keyId = field("AccessKeyId");
    auto secret = field("SecretAccessKey");
    if (!keyId || !secret) {
        throw core::AuthFailedError("Unexpected credential response from aws",
                                    "Make sure AWS CLI v2 is installed");
    }

    CredentialSet creds;
    creds.accessKeyId = *keyId;
    creds.secretAccessKey = *secret;
    creds.sessionToken = field("SessionToken");
    if (auto expiration = field("Expiration")) {
        TimePoint tp;
        if (!core::parseIsoTime(*expiration, tp)) {
            throw core::AuthFailedError("Unparseable credential expiration from aws");
        }
        creds.expiration = tp;
    }
    if (creds.sessionToken && !creds.expiration) {
        throw core::AuthFailedError("Temporary credentials from aws carry no expiration",
                                    "Make sure AWS CLI v2 is installed");
    }
    return creds;
}

std::optional<std::string> accountFromArn(const std::string& arn) {
    // arn:partition:service:region:account:resource
    std::vector<std::string> parts;
    size_t start = 0;
    for (int n = 0; n < 5; ++n) {
        size_t colon = arn.find(':', start);
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        parts.push_back(arn.substr(start, colon - start));
        start = colon + 1;
    }
    const std::string& account = parts[4];
    if (parts[0] != "arn" || account.size() != 12 ||
        !std::all_of(account.begin(), account.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return account;
}

// RetryPolicy
std::chrono::milliseconds RetryPolicy::delayFor(int attempt, std::mt19937& rng) const {
    double base = static_cast<double>(baseDelay.count()) * std::pow(factor, attempt - 1);
    auto delay = static_cast<long long>(base);
    long long jitter = 0;
    if (delay / 2 > 0) {
        std::uniform_int_distribution<long long> dist(0, delay / 2 - 1);
        jitter = dist(rng);
    }
    return std::chrono::milliseconds(delay + jitter);
}

// AwsCliStsClient
AwsCliStsClient::AwsCliStsClient(const core::Config& cfg)
    : cfg_(cfg) {}

const std::string& AwsCliStsClient::binary() {
    if (binaryPath_.empty()) {
        auto found = system::findExecutable(cfg_.awsBinary);
        if (!found) {
            throw core::ExecutableNotFoundError(cfg_.awsBinary);
        }
        binaryPath_ = *found;
    }
    return binaryPath_;
}

system::ProcessResult AwsCliStsClient::invoke(const std::vector<std::string>& args,
                                              const system::Environment& env,
                                              std::chrono::milliseconds timeout) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 5);
    argv.push_back(cfg_.awsBinary);
    argv.insert(argv.end(), args.begin(), args.end());
    argv.push_back("--output");
    argv.push_back("json");
    argv.push_back("--cli-connect-timeout");
    argv.push_back(std::to_string(cfg_.connectTimeout.count()));

    core::debug(cfg_, "aws " + args[0] + " " + args[1]);
    return system::runProcess(binary(), argv, env, timeout);
}

system::Environment AwsCliStsClient::profileEnvironment(const std::string& profile) const {
    system::Environment env = system::currentEnvironment();
    for (const auto& var : CREDENTIAL_VARS) {
        env.erase(var);
    }
    env["AWS_PROFILE"] = profile;
    env["AWS_PAGER"] = "";
    return env;
}

system::Environment AwsCliStsClient::credentialEnvironment(const CredentialSet& base) const {
    system::Environment env = system::currentEnvironment();
    env.erase("AWS_PROFILE");
    env.erase("AWS_SECURITY_TOKEN");
    env["AWS_ACCESS_KEY_ID"] = base.accessKeyId;
    env["AWS_SECRET_ACCESS_KEY"] = base.secretAccessKey;
    if (base.sessionToken) {
        env["AWS_SESSION_TOKEN"] = *base.sessionToken;
    } else {
        env.erase("AWS_SESSION_TOKEN");
    }
    if (base.region && !env.count("AWS_REGION") && !env.count("AWS_DEFAULT_REGION")) {
        env["AWS_DEFAULT_REGION"] = *base.region;
    }
    env["AWS_PAGER"] = "";
    return env;
}

ProbeResult AwsCliStsClient::probeIdentity(const std::string& profile) {
    auto result = invoke({"sts", "get-caller-identity", "--profile", profile},
                         profileEnvironment(profile), cfg_.connectTimeout);
    if (result.timedOut) {
        return ProbeResult::TIMED_OUT;
    }
    return result.success() ? ProbeResult::VALID : ProbeResult::INVALID;
}

std::string AwsCliStsClient::callerAccount(const CredentialSet& base) {
    auto result = invoke({"sts", "get-caller-identity"}, credentialEnvironment(base), cfg_.requestTimeout);
    if (!result.success()) {
        throwFailure("get-caller-identity", result);
    }
    auto fields = parseJsonFields(result.out);
    auto it = fields.find("Account");
    if (it == fields.end() || it->second.empty()) {
        throw core::AuthFailedError("Unexpected get-caller-identity response from aws");
    }
    return it->second;
}

CredentialSet AwsCliStsClient::exportSsoCredentials(const std::string& profile) {
    auto result = invoke({"configure", "export-credentials", "--profile", profile, "--format", "process"},
                         profileEnvironment(profile), cfg_.requestTimeout);
    if (!result.success()) {
        throwFailure("export-credentials", result);
    }
    return parseCredentialsJson(result.out);
}

void AwsCliStsClient::ssoLogin(const std::string& profile) {
    std::vector<std::string> argv = {cfg_.awsBinary, "sso", "login", "--profile", profile};
    int rc = system::runInteractive(binary(), argv, profileEnvironment(profile));
    if (rc != 0) {
        throw core::AuthFailedError("aws sso login failed for profile '" + profile + "' (exit " +
                                    std::to_string(rc) + ")",
                                    "Check sso_start_url and sso_region of the profile");
    }
}

CredentialSet AwsCliStsClient::getSessionToken(const CredentialSet& base, const MfaToken& mfa,
                                               int durationSeconds) {
    auto result = invoke({"sts", "get-session-token",
                          "--serial-number", mfa.serial,
                          "--token-code", mfa.code,
                          "--duration-seconds", std::to_string(durationSeconds)},
                         credentialEnvironment(base), cfg_.requestTimeout);
    if (!result.success()) {
        throwFailure("get-session-token", result);
    }
    return parseCredentialsJson(result.out);
}

CredentialSet AwsCliStsClient::assumeRole(const CredentialSet& base, const std::string& roleArn,
                                          const std::string& sessionName, int durationSeconds,
                                          const std::optional<MfaToken>& mfa) {
    std::vector<std::string> args = {"sts", "assume-role",
                                     "--role-arn", roleArn,
                                     "--role-session-name", sessionName,
                                     "--duration-seconds", std::to_string(durationSeconds)};
    if (mfa) {
        args.insert(args.end(), {"--serial-number", mfa->serial, "--token-code", mfa->code});
    }
    auto result = invoke(args, credentialEnvironment(base), cfg_.requestTimeout);
    if (!result.success()) {
        throwFailure("assume-role " + core::maskArn(roleArn), result);
    }
    return parseCredentialsJson(result.out);
}

} // namespace auth
} // namespace awx
