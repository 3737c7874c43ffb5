#pragma once

#include <gmock/gmock.h>
#include "credentials.hpp"

namespace gcscache {

// Mock the raw IAM Credentials SDK interface
class MockIAMCredentialsSDKClient : public IIAMCredentialsSDKClient {
public:
    MOCK_METHOD(
        google::cloud::StatusOr<AccessToken>,
        GenerateAccessToken,
        (const GenerateAccessTokenRequest& request),
        (const, override)
    );
};

} // namespace gcscache
