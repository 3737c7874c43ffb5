#pragma once

#include <string>
#include <optional>
#include <memory>
#include <ostream>
#include "google/cloud/storage/client.h"
#include "gcs_sdk_interface.hpp"
#include "object_transport.hpp"

namespace gcs = ::google::cloud::storage;

namespace gcscache {

/**
 * GCSClient - Object transport backed by Google Cloud Storage
 *
 * Listing pages hold at most page_size entries. The continuation token of a
 * truncated page is the last object name it returned; the next page resumes
 * from that name (StartOffset is inclusive, so the token itself is skipped).
 * Uses dependency injection with IGCSSDKClient to enable proper unit testing.
 */
class GCSClient : public IObjectTransport {
public:
    static constexpr int kDefaultPageSize = 1000;

    explicit GCSClient(int page_size = kDefaultPageSize);
    explicit GCSClient(const gcs::Client& client, int page_size = kDefaultPageSize);
    // Constructor for dependency injection (enables mocking in tests)
    explicit GCSClient(std::unique_ptr<IGCSSDKClient> sdk_client, int page_size = kDefaultPageSize);
    ~GCSClient() override = default;

    StatusOr<ListPage> listPage(
        const std::string& bucket_name,
        const std::string& prefix,
        const std::optional<std::string>& continuation_token) const override;

    Status download(
        const std::string& bucket_name,
        const std::string& object_name,
        std::ostream& destination) const override;

    int pageSize() const { return page_size_; }

private:
    std::unique_ptr<IGCSSDKClient> sdk_client_;
    int page_size_;
};

} // namespace gcscache
