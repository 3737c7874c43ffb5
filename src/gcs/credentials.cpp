#include "credentials.hpp"
#include "errors.hpp"
#include "google/cloud/options.h"
#include "google/cloud/common_options.h"
#include <google/protobuf/duration.pb.h>

namespace gcscache {

const char kStorageReadOnlyScope[] = "https://www.googleapis.com/auth/devstorage.read_only";

IAMCredentialsSDKClientImpl::IAMCredentialsSDKClientImpl()
    : client_(google::cloud::iam_credentials_v1::MakeIAMCredentialsConnection()) {}

IAMCredentialsSDKClientImpl::IAMCredentialsSDKClientImpl(
    google::cloud::iam_credentials_v1::IAMCredentialsClient client)
    : client_(std::move(client)) {}

google::cloud::StatusOr<IIAMCredentialsSDKClient::AccessToken>
IAMCredentialsSDKClientImpl::GenerateAccessToken(const GenerateAccessTokenRequest& request) const {
    google::protobuf::Duration lifetime;
    lifetime.set_seconds(request.lifetime.count());

    // The session name travels in the user agent so it shows up in audit logs
    auto options = google::cloud::Options{}.set<google::cloud::UserAgentProductsOption>(
        {"gcscache-session/" + request.session_name});

    auto response = client_.GenerateAccessToken(
        "projects/-/serviceAccounts/" + request.service_account,
        {},
        request.scopes,
        lifetime,
        std::move(options));
    if (!response) {
        return std::move(response).status();
    }

    AccessToken token;
    token.token = response->access_token();
    token.expiration = std::chrono::system_clock::time_point(
        std::chrono::seconds(response->expire_time().seconds()));
    return token;
}

TemporaryCredentials assumeRole(
    const IIAMCredentialsSDKClient& iam,
    const std::string& role,
    const std::string& session_name)
{
    IIAMCredentialsSDKClient::GenerateAccessTokenRequest request;
    request.service_account = role;
    request.session_name = session_name;
    request.scopes = {kStorageReadOnlyScope};

    auto token = iam.GenerateAccessToken(request);
    if (!token) {
        throw AuthorizationError(role, token.status());
    }

    TemporaryCredentials credentials;
    credentials.access_key_id = role;
    credentials.session_token = token->token;
    credentials.expiration = token->expiration;
    return credentials;
}

} // namespace gcscache
