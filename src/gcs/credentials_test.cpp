#include "credentials.hpp"
#include "errors.hpp"
#include "mock_iam_credentials.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <string>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::Return;

using gcscache::MockIAMCredentialsSDKClient;

TEST(AssumeRoleTest, ReturnsTemporaryCredentials) {
    MockIAMCredentialsSDKClient iam;
    const auto expiration = std::chrono::system_clock::time_point(std::chrono::seconds(1800000000));

    EXPECT_CALL(iam, GenerateAccessToken(_))
        .WillOnce(Invoke([&](const gcscache::IIAMCredentialsSDKClient::GenerateAccessTokenRequest& request) {
            EXPECT_EQ(request.service_account, "reader@project.iam.gserviceaccount.com");
            EXPECT_EQ(request.session_name, "nightly-report");
            EXPECT_THAT(request.scopes, ElementsAre(gcscache::kStorageReadOnlyScope));
            gcscache::IIAMCredentialsSDKClient::AccessToken token;
            token.token = "ya29.token";
            token.expiration = expiration;
            return google::cloud::StatusOr<gcscache::IIAMCredentialsSDKClient::AccessToken>(token);
        }));

    auto credentials = gcscache::assumeRole(
        iam, "reader@project.iam.gserviceaccount.com", "nightly-report");

    EXPECT_EQ(credentials.access_key_id, "reader@project.iam.gserviceaccount.com");
    EXPECT_EQ(credentials.secret_access_key, "");
    EXPECT_EQ(credentials.session_token, "ya29.token");
    EXPECT_EQ(credentials.expiration, expiration);
}

TEST(AssumeRoleTest, FailureRaisesAuthorizationError) {
    MockIAMCredentialsSDKClient iam;
    google::cloud::Status denied(google::cloud::StatusCode::kPermissionDenied,
                                 "caller lacks iam.serviceAccounts.getAccessToken");

    EXPECT_CALL(iam, GenerateAccessToken(_))
        .WillOnce(Return(google::cloud::StatusOr<gcscache::IIAMCredentialsSDKClient::AccessToken>(denied)));

    try {
        gcscache::assumeRole(iam, "reader@project.iam.gserviceaccount.com", "s");
        FAIL() << "expected AuthorizationError";
    } catch (const gcscache::AuthorizationError& e) {
        EXPECT_EQ(e.status().code(), google::cloud::StatusCode::kPermissionDenied);
        EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("reader@project.iam.gserviceaccount.com"));
    }
}

TEST(AssumeRoleTest, EveryCallRequestsFreshCredentials) {
    MockIAMCredentialsSDKClient iam;
    gcscache::IIAMCredentialsSDKClient::AccessToken first;
    first.token = "first";
    gcscache::IIAMCredentialsSDKClient::AccessToken second;
    second.token = "second";

    EXPECT_CALL(iam, GenerateAccessToken(_))
        .WillOnce(Return(google::cloud::StatusOr<gcscache::IIAMCredentialsSDKClient::AccessToken>(first)))
        .WillOnce(Return(google::cloud::StatusOr<gcscache::IIAMCredentialsSDKClient::AccessToken>(second)));

    EXPECT_EQ(gcscache::assumeRole(iam, "sa", "s").session_token, "first");
    EXPECT_EQ(gcscache::assumeRole(iam, "sa", "s").session_token, "second");
}
