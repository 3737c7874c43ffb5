#pragma once

#include <string>
#include <cstdint>
#include "google/cloud/storage/client.h"
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace gcs = ::google::cloud::storage;
using google::cloud::Status;
using google::cloud::StatusOr;

namespace gcscache {

/**
 * Raw interface wrapper for GCS SDK - minimal logic, just exposes SDK types
 * This allows mocking the SDK in tests while GCSClient contains the business logic
 */
class IGCSSDKClient {
public:
    virtual ~IGCSSDKClient() = default;

    // Request struct for ReadObject
    struct ReadObjectRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const ReadObjectRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    // Request struct for ListObjects
    struct ListObjectsRequest {
        std::string bucket_name;
        std::string prefix;
        // Inclusive lower bound on object names, empty for none
        std::string start_offset;
        int max_results = 0;

        bool operator==(const ListObjectsRequest& other) const {
            return bucket_name == other.bucket_name &&
                   prefix == other.prefix &&
                   start_offset == other.start_offset &&
                   max_results == other.max_results;
        }
    };

    // Read object - returns SDK's ObjectReadStream
    virtual gcs::ObjectReadStream ReadObject(const ReadObjectRequest& request) const = 0;

    // List objects - returns SDK's ListObjectsReader
    virtual gcs::ListObjectsReader ListObjects(const ListObjectsRequest& request) const = 0;
};

/**
 * Real implementation - thin wrapper over google::cloud::storage::Client
 * Just forwards calls to the SDK with no business logic
 */
class GCSSDKClientImpl : public IGCSSDKClient {
public:
    GCSSDKClientImpl();
    explicit GCSSDKClientImpl(const gcs::Client& client);

    gcs::ObjectReadStream ReadObject(const ReadObjectRequest& request) const override;

    gcs::ListObjectsReader ListObjects(const ListObjectsRequest& request) const override;

private:
    mutable gcs::Client client_;
};

} // namespace gcscache
