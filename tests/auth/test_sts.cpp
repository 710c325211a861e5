#include "gtest/gtest.h"
#include "auth/sts.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"
#include <random>
#include <vector>

using namespace awx::auth;
using awx::testing::TempDir;

namespace {

const char* SESSION_RESPONSE = R"({
    "Credentials": {
        "AccessKeyId": "ASIATEMP0000000000",
        "SecretAccessKey": "tempsecret",
        "SessionToken": "FwoGZXIvYXdzEJr\/\/token",
        "Expiration": "2030-01-01T12:00:00+00:00"
    }
})";

// Stand-in for the aws binary. Behaviour is selected by the subcommand and
// the MFA code or profile passed to it.
const char* FAKE_AWS = R"(#!/bin/sh
case "$1 $2" in
"sts get-caller-identity")
    if [ "$3" = "--profile" ]; then
        case "$4" in
            valid) echo '{"Account": "123456789012"}'; exit 0 ;;
            slow) exec sleep 5 ;;
            *) echo "Error loading SSO Token: Token for $4 does not exist" >&2; exit 255 ;;
        esac
    fi
    [ "$AWS_ACCESS_KEY_ID" = "AKIABASE" ] || exit 9
    [ -z "$AWS_PROFILE" ] || exit 10
    echo '{"UserId": "AIDA", "Account": "123456789012", "Arn": "arn:aws:iam::123456789012:user/alice"}'
    ;;
"sts get-session-token")
    case "$6" in
        123456) printf '%s' "$SESSION_RESPONSE" ;;
        000000) echo "An error occurred (AccessDenied) when calling the GetSessionToken operation: MultiFactorAuthentication failed with invalid MFA one time pass code." >&2; exit 254 ;;
        111111) echo "Could not connect to the endpoint URL: \"https://sts.amazonaws.com/\"" >&2; exit 255 ;;
        *) echo "something odd" >&2; exit 1 ;;
    esac
    ;;
"sts assume-role")
    [ "$AWS_SESSION_TOKEN" = "basetoken" ] || exit 11
    [ "$8" = "900" ] || exit 12
    printf '%s' "$SESSION_RESPONSE"
    ;;
"configure export-credentials")
    echo '{"Version": 1, "AccessKeyId": "ASIASSO", "SecretAccessKey": "ssosecret", "SessionToken": "ssotoken", "Expiration": "2030-01-01T12:00:00Z"}'
    ;;
*)
    exit 2
    ;;
esac
)";

class AwsCliStsClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = dir_.write("aws", FAKE_AWS, 0755);
        cfg_.awsBinary = script_;
        cfg_.connectTimeout = std::chrono::seconds(1);
        cfg_.requestTimeout = std::chrono::seconds(10);

        base_.accessKeyId = "AKIABASE";
        base_.secretAccessKey = "basesecret";
    }

    TempDir dir_;
    std::string script_;
    awx::core::Config cfg_;
    CredentialSet base_;
    awx::testing::ScopedEnv response_{"SESSION_RESPONSE", SESSION_RESPONSE};
    awx::testing::ScopedEnv noProfile_{"AWS_PROFILE", ""};
};

}

TEST(FailureClassification, KnownCategories) {
    ASSERT_EQ(classifyFailure("Could not connect to the endpoint URL"), FailureKind::TRANSIENT);
    ASSERT_EQ(classifyFailure("An error occurred (Throttling): Rate exceeded"), FailureKind::TRANSIENT);
    ASSERT_EQ(classifyFailure("MultiFactorAuthentication failed with invalid MFA one time pass code"),
              FailureKind::INVALID_MFA);
    ASSERT_EQ(classifyFailure("Error when retrieving token from sso: Token has expired and refresh failed"),
              FailureKind::SSO_SESSION);
    ASSERT_EQ(classifyFailure("An error occurred (ExpiredToken) when calling the AssumeRole operation"),
              FailureKind::EXPIRED_TOKEN);
    ASSERT_EQ(classifyFailure("An error occurred (InvalidClientTokenId)"), FailureKind::INVALID_CLIENT_TOKEN);
    ASSERT_EQ(classifyFailure("Unable to locate credentials."), FailureKind::INVALID_CLIENT_TOKEN);
    ASSERT_EQ(classifyFailure("An error occurred (ValidationError): 1 validation error detected"),
              FailureKind::MALFORMED_INPUT);
    ASSERT_EQ(classifyFailure("An error occurred (AccessDenied) when calling the AssumeRole operation: "
                              "User is not authorized to perform: sts:AssumeRole"),
              FailureKind::ACCESS_DENIED);
    ASSERT_EQ(classifyFailure(""), FailureKind::OTHER);
}

TEST(FailureClassification, DescriptionsAreGeneric) {
    ASSERT_EQ(describeFailure(FailureKind::INVALID_MFA), "invalid MFA code");
    ASSERT_EQ(describeFailure(FailureKind::ACCESS_DENIED), "access denied");
    ASSERT_EQ(describeFailure(FailureKind::OTHER), "unexpected error");
}

TEST(JsonFieldParsing, NestedObjectsAndNumbers) {
    auto fields = parseJsonFields(R"({"Credentials": {"AccessKeyId": "AKIA", "Nested": {"Deep": "x"}},
                                      "Version": 1, "Flag": true, "List": ["a", "b"], "Esc": "a\"b\\cA"})");
    ASSERT_EQ(fields["AccessKeyId"], "AKIA");
    ASSERT_EQ(fields["Deep"], "x");
    ASSERT_EQ(fields["Version"], "1");
    ASSERT_EQ(fields["Flag"], "true");
    ASSERT_EQ(fields["Esc"], "a\"b\\cA");
    ASSERT_EQ(fields.count("a"), 0u);
}

TEST(JsonFieldParsing, GarbageYieldsNothing) {
    ASSERT_TRUE(parseJsonFields("").empty());
    ASSERT_TRUE(parseJsonFields("not json at all").empty());
}

TEST(CredentialParsing, SessionTokenResponse) {
    CredentialSet creds = parseCredentialsJson(SESSION_RESPONSE);
    ASSERT_EQ(creds.accessKeyId, "ASIATEMP0000000000");
    ASSERT_EQ(creds.secretAccessKey, "tempsecret");
    ASSERT_EQ(*creds.sessionToken, "FwoGZXIvYXdzEJr//token");
    ASSERT_TRUE(creds.isTemporary());
    ASSERT_EQ(awx::core::formatTimeUTC(*creds.expiration), "2030-01-01T12:00:00Z");
}

TEST(CredentialParsing, MissingKeysAreRejected) {
    ASSERT_THROW(parseCredentialsJson(R"({"AccessKeyId": "AKIA"})"), awx::core::AuthFailedError);
    ASSERT_THROW(parseCredentialsJson(R"({"AccessKeyId": "AKIA", "SecretAccessKey": "s",
                                          "Expiration": "tomorrow"})"),
                 awx::core::AuthFailedError);
}

TEST(CredentialParsing, SessionTokenRequiresExpiration) {
    try {
        parseCredentialsJson(R"({"AccessKeyId": "ASIATEMP", "SecretAccessKey": "s", "SessionToken": "tok"})");
        FAIL() << "expected AuthFailedError";
    } catch (const awx::core::AuthFailedError& e) {
        std::string msg = e.what();
        ASSERT_EQ(msg.find("tok"), std::string::npos);
    }
}

TEST(CredentialParsing, NullTokenIsAbsent) {
    CredentialSet creds = parseCredentialsJson(R"({"AccessKeyId": "AKIA", "SecretAccessKey": "s",
                                                   "SessionToken": null})");
    ASSERT_FALSE(creds.sessionToken.has_value());
    ASSERT_FALSE(creds.isTemporary());
}

TEST(ArnParsing, AccountExtraction) {
    ASSERT_EQ(*accountFromArn("arn:aws:iam::123456789012:mfa/alice"), "123456789012");
    ASSERT_EQ(*accountFromArn("arn:aws-cn:iam::210987654321:role/x"), "210987654321");
    ASSERT_FALSE(accountFromArn("GAHT12345678").has_value());
    ASSERT_FALSE(accountFromArn("arn:aws:iam::1234:mfa/alice").has_value());
    ASSERT_FALSE(accountFromArn("arn:aws:iam::12345678901x:mfa/alice").has_value());
}

TEST(RetryPolicyDelays, GrowWithJitterBounds) {
    RetryPolicy policy;
    std::mt19937 rng(42);
    for (int i = 0; i < 50; ++i) {
        auto first = policy.delayFor(1, rng).count();
        ASSERT_GE(first, 300);
        ASSERT_LT(first, 450);

        auto second = policy.delayFor(2, rng).count();
        ASSERT_GE(second, 689);
        ASSERT_LT(second, 1035);
    }
}

TEST(RetryTransient, RetriesUntilSuccess) {
    std::vector<long long> delays;
    RetryPolicy policy;
    policy.sleeper = [&](std::chrono::milliseconds d) { delays.push_back(d.count()); };

    int calls = 0;
    int result = retryTransient(policy, [&]() {
        if (++calls < 3) {
            throw awx::core::TransientNetworkError("blip");
        }
        return 7;
    });

    ASSERT_EQ(result, 7);
    ASSERT_EQ(calls, 3);
    ASSERT_EQ(delays.size(), 2u);
}

TEST(RetryTransient, GivesUpAfterMaxAttempts) {
    RetryPolicy policy;
    policy.sleeper = [](std::chrono::milliseconds) {};

    int calls = 0;
    ASSERT_THROW(retryTransient(policy, [&]() -> int {
        ++calls;
        throw awx::core::TransientNetworkError("down");
    }), awx::core::TransientNetworkError);
    ASSERT_EQ(calls, 3);
}

TEST(RetryTransient, OtherErrorsAreNotRetried) {
    RetryPolicy policy;
    policy.sleeper = [](std::chrono::milliseconds) {};

    int calls = 0;
    ASSERT_THROW(retryTransient(policy, [&]() -> int {
        ++calls;
        throw awx::core::AuthFailedError("denied");
    }), awx::core::AuthFailedError);
    ASSERT_EQ(calls, 1);
}

TEST_F(AwsCliStsClientTest, GetSessionToken) {
    AwsCliStsClient sts(cfg_);
    CredentialSet creds = sts.getSessionToken(base_, MfaToken{"arn:aws:iam::123456789012:mfa/alice", "123456"}, 3600);
    ASSERT_EQ(creds.accessKeyId, "ASIATEMP0000000000");
    ASSERT_TRUE(creds.isTemporary());
}

TEST_F(AwsCliStsClientTest, InvalidMfaCodeIsAuthFailureWithoutSecrets) {
    AwsCliStsClient sts(cfg_);
    try {
        sts.getSessionToken(base_, MfaToken{"arn:aws:iam::123456789012:mfa/alice", "000000"}, 3600);
        FAIL() << "expected InvalidMfaCodeError";
    } catch (const awx::core::InvalidMfaCodeError& e) {
        std::string msg = e.what();
        ASSERT_EQ(msg, "get-session-token failed: invalid MFA code");
        ASSERT_EQ(e.hint(), "Wait for the next code and try again");
        ASSERT_EQ(msg.find("000000"), std::string::npos);
        ASSERT_EQ(msg.find("basesecret"), std::string::npos);
    }
}

TEST_F(AwsCliStsClientTest, EndpointFailureIsTransient) {
    AwsCliStsClient sts(cfg_);
    ASSERT_THROW(sts.getSessionToken(base_, MfaToken{"arn:aws:iam::123456789012:mfa/alice", "111111"}, 3600),
                 awx::core::TransientNetworkError);
}

TEST_F(AwsCliStsClientTest, UnknownFailureIsAuthFailure) {
    AwsCliStsClient sts(cfg_);
    ASSERT_THROW(sts.getSessionToken(base_, MfaToken{"arn:aws:iam::123456789012:mfa/alice", "999999"}, 3600),
                 awx::core::AuthFailedError);
}

TEST_F(AwsCliStsClientTest, CallerAccountUsesBaseCredentials) {
    AwsCliStsClient sts(cfg_);
    ASSERT_EQ(sts.callerAccount(base_), "123456789012");
}

TEST_F(AwsCliStsClientTest, AssumeRolePassesSessionToken) {
    AwsCliStsClient sts(cfg_);
    base_.sessionToken = "basetoken";
    CredentialSet creds = sts.assumeRole(base_, "arn:aws:iam::123456789012:role/Admin", "awx-1-1", 900,
                                         std::nullopt);
    ASSERT_EQ(creds.accessKeyId, "ASIATEMP0000000000");
}

TEST_F(AwsCliStsClientTest, ExportSsoCredentials) {
    AwsCliStsClient sts(cfg_);
    CredentialSet creds = sts.exportSsoCredentials("valid");
    ASSERT_EQ(creds.accessKeyId, "ASIASSO");
    ASSERT_EQ(*creds.sessionToken, "ssotoken");
}

TEST_F(AwsCliStsClientTest, ProbeOutcomes) {
    AwsCliStsClient sts(cfg_);
    ASSERT_EQ(sts.probeIdentity("valid"), ProbeResult::VALID);
    ASSERT_EQ(sts.probeIdentity("expired"), ProbeResult::INVALID);
    ASSERT_EQ(sts.probeIdentity("slow"), ProbeResult::TIMED_OUT);
}

TEST(AwsCliStsClientLookup, MissingBinary) {
    awx::core::Config cfg;
    cfg.awsBinary = "/nonexistent/awx-test/aws";
    AwsCliStsClient sts(cfg);
    ASSERT_THROW(sts.probeIdentity("p"), awx::core::ExecutableNotFoundError);
}
