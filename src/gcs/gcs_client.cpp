#include "gcs_client.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace gcscache {

namespace {

constexpr std::size_t kDownloadChunkSize = 1024 * 1024;

ObjectEntry toEntry(const gcs::ObjectMetadata& metadata) {
    ObjectEntry entry;
    entry.key = metadata.name();
    entry.size = static_cast<std::int64_t>(metadata.size());
    entry.last_modified = metadata.updated();
    entry.fingerprint = metadata.etag();
    return entry;
}

} // namespace

GCSClient::GCSClient(int page_size)
    : GCSClient(std::make_unique<GCSSDKClientImpl>(), page_size) {}

GCSClient::GCSClient(const gcs::Client& client, int page_size)
    : GCSClient(std::make_unique<GCSSDKClientImpl>(client), page_size) {}

GCSClient::GCSClient(std::unique_ptr<IGCSSDKClient> sdk_client, int page_size)
    : sdk_client_(std::move(sdk_client)),
      page_size_(page_size)
{
    if (page_size_ <= 0) {
        throw std::invalid_argument("Page size must be positive, got " + std::to_string(page_size_));
    }
}

StatusOr<ListPage> GCSClient::listPage(
    const std::string& bucket_name,
    const std::string& prefix,
    const std::optional<std::string>& continuation_token) const
{
    IGCSSDKClient::ListObjectsRequest request;
    request.bucket_name = bucket_name;
    request.prefix = prefix;
    request.start_offset = continuation_token.value_or("");
    // One extra object detects truncation; StartOffset is inclusive, so a
    // continuation also returns the token object again
    request.max_results = page_size_ + (continuation_token ? 2 : 1);

    ListPage page;
    const auto limit = static_cast<std::size_t>(page_size_);

    try {
        auto objects = sdk_client_->ListObjects(request);

        for (auto&& object_metadata : objects) {
            if (!object_metadata) {
                std::cerr << "Error listing objects: " << object_metadata.status().message() << std::endl;
                return std::move(object_metadata).status();
            }
            if (continuation_token && object_metadata->name() == *continuation_token) {
                continue;
            }
            // One more object than fits means there is a next page
            if (page.entries.size() == limit) {
                page.is_truncated = true;
                page.next_token = page.entries.back().key;
                break;
            }
            page.entries.push_back(toEntry(*object_metadata));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error listing objects: " << e.what() << std::endl;
        return Status(google::cloud::StatusCode::kUnknown, e.what());
    }

    return page;
}

Status GCSClient::download(
    const std::string& bucket_name,
    const std::string& object_name,
    std::ostream& destination) const
{
    IGCSSDKClient::ReadObjectRequest request;
    request.bucket_name = bucket_name;
    request.object_name = object_name;

    auto reader = sdk_client_->ReadObject(request);
    if (!reader) {
        std::cerr << "Error reading object: " << reader.status().message() << std::endl;
        return reader.status();
    }

    std::vector<char> buffer(kDownloadChunkSize);
    while (reader.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || reader.gcount() > 0) {
        destination.write(buffer.data(), reader.gcount());
        if (!destination) {
            return Status(google::cloud::StatusCode::kDataLoss,
                          "Error writing local copy of " + object_name);
        }
    }

    if (!reader.status().ok()) {
        std::cerr << "Error reading object: " << reader.status().message() << std::endl;
        return reader.status();
    }
    return Status();
}

} // namespace gcscache
