#pragma once

#include <string>
#include <vector>
#include <chrono>
#include "google/cloud/iam/credentials/v1/iam_credentials_client.h"
#include "google/cloud/status_or.h"

namespace gcscache {

/**
 * TemporaryCredentials - Short-lived credentials for the storage transport
 *
 * For GCS the impersonated service account is the key id and the OAuth2
 * access token is the session token; there is no separate secret.
 */
struct TemporaryCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::chrono::system_clock::time_point expiration;
};

/**
 * Raw interface wrapper for the IAM Credentials SDK
 * Keeps protobuf types out of the callers and lets tests mock the exchange
 */
class IIAMCredentialsSDKClient {
public:
    virtual ~IIAMCredentialsSDKClient() = default;

    struct GenerateAccessTokenRequest {
        std::string service_account;
        std::string session_name;
        std::vector<std::string> scopes;
        std::chrono::seconds lifetime{3600};

        bool operator==(const GenerateAccessTokenRequest& other) const {
            return service_account == other.service_account &&
                   session_name == other.session_name &&
                   scopes == other.scopes &&
                   lifetime == other.lifetime;
        }
    };

    struct AccessToken {
        std::string token;
        std::chrono::system_clock::time_point expiration;
    };

    virtual google::cloud::StatusOr<AccessToken> GenerateAccessToken(
        const GenerateAccessTokenRequest& request) const = 0;
};

/**
 * Real implementation over iam_credentials_v1::IAMCredentialsClient
 */
class IAMCredentialsSDKClientImpl : public IIAMCredentialsSDKClient {
public:
    IAMCredentialsSDKClientImpl();
    explicit IAMCredentialsSDKClientImpl(
        google::cloud::iam_credentials_v1::IAMCredentialsClient client);

    google::cloud::StatusOr<AccessToken> GenerateAccessToken(
        const GenerateAccessTokenRequest& request) const override;

private:
    mutable google::cloud::iam_credentials_v1::IAMCredentialsClient client_;
};

// Read-only storage scope requested for impersonated tokens
extern const char kStorageReadOnlyScope[];

/**
 * Exchange a role (service account) for temporary credentials
 *
 * Every call requests fresh credentials; nothing is memoized.
 *
 * @param iam IAM credentials client
 * @param role Service account email to impersonate
 * @param session_name Label attached to the exchange request
 * @return Temporary credentials
 * @throws AuthorizationError if the role cannot be assumed
 */
TemporaryCredentials assumeRole(
    const IIAMCredentialsSDKClient& iam,
    const std::string& role,
    const std::string& session_name);

} // namespace gcscache
