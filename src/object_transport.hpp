#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <ostream>
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace gcscache {

using google::cloud::Status;
using google::cloud::StatusOr;

/**
 * ObjectEntry - One raw entry of a listing page
 */
struct ObjectEntry {
    std::string key;
    std::int64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string fingerprint;

    bool operator==(const ObjectEntry& other) const {
        return key == other.key && size == other.size &&
               last_modified == other.last_modified && fingerprint == other.fingerprint;
    }
};

/**
 * ListPage - A bounded page of listing results plus the continuation state
 */
struct ListPage {
    std::vector<ObjectEntry> entries;
    bool is_truncated = false;
    // Set whenever is_truncated is true
    std::optional<std::string> next_token;
};

/**
 * IObjectTransport - Narrow interface the cache core consumes
 *
 * Performs prefix listing with continuation-token pagination and downloads
 * single objects. Implementations own the network connection.
 */
class IObjectTransport {
public:
    virtual ~IObjectTransport() = default;

    // Fetch one page of objects whose key starts with prefix. An empty token
    // requests the first page.
    virtual StatusOr<ListPage> listPage(
        const std::string& bucket_name,
        const std::string& prefix,
        const std::optional<std::string>& continuation_token) const = 0;

    // Stream the bytes of one object into destination
    virtual Status download(
        const std::string& bucket_name,
        const std::string& object_name,
        std::ostream& destination) const = 0;
};

} // namespace gcscache
