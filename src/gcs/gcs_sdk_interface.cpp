#include "gcs_sdk_interface.hpp"

namespace gcscache {

GCSSDKClientImpl::GCSSDKClientImpl() : client_(gcs::Client()) {}

GCSSDKClientImpl::GCSSDKClientImpl(const gcs::Client& client) : client_(client) {}

gcs::ObjectReadStream GCSSDKClientImpl::ReadObject(const ReadObjectRequest& request) const {
    return client_.ReadObject(request.bucket_name, request.object_name);
}

gcs::ListObjectsReader GCSSDKClientImpl::ListObjects(const ListObjectsRequest& request) const {
    // Default-constructed options are not sent with the request
    return client_.ListObjects(
        request.bucket_name,
        gcs::Prefix(request.prefix),
        request.start_offset.empty() ? gcs::StartOffset() : gcs::StartOffset(request.start_offset),
        request.max_results > 0 ? gcs::MaxResults(request.max_results) : gcs::MaxResults()
    );
}

} // namespace gcscache
