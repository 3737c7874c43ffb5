#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <iostream>
#include "config.hpp"
#include "object_transport.hpp"
#include "object_stream.hpp"
#include "remote_object.hpp"

namespace gcscache {

/**
 * RemoteStore - Handle on one bucket and its local cache directory
 *
 * The transport is created on first use and reused for the lifetime of the
 * handle. Each handle owns its own transport, so differently configured
 * handles can coexist in one process. Not safe for concurrent use.
 */
class RemoteStore {
public:
    using TransportFactory = std::function<std::unique_ptr<IObjectTransport>(const CacheConfig&)>;

    explicit RemoteStore(CacheConfig config, std::ostream* progress = &std::cout);
    // Constructor for dependency injection (enables mocking in tests)
    RemoteStore(CacheConfig config, TransportFactory transport_factory,
                std::ostream* progress = &std::cout);

    RemoteStore(const RemoteStore&) = delete;
    RemoteStore& operator=(const RemoteStore&) = delete;

    const std::string& bucketName() const { return config_.bucket_name; }
    const std::string& cacheRoot() const { return cache_root_; }
    const CacheConfig& config() const { return config_; }

    // Creates the transport on first call
    IObjectTransport& transport();

    // Lazy stream of every object whose key starts with prefix
    ObjectStream<RemoteObject> ls(const std::string& prefix = "");

    // One lazy stream per prefix, in the given order. Prefixes are neither
    // merged nor deduplicated.
    std::vector<ObjectStream<RemoteObject>> ls(const std::vector<std::string>& prefixes);

    // Page source for one prefix; writes a progress marker per request
    PageFetcher pageFetcher(const std::string& prefix);

    // Write msg to the progress sink if level is below the configured verbosity
    void say(const std::string& msg, int level = 0) const;

    std::string toString() const;

private:
    CacheConfig config_;
    std::string cache_root_;
    TransportFactory transport_factory_;
    std::unique_ptr<IObjectTransport> transport_;
    std::ostream* progress_;
};

class IIAMCredentialsSDKClient;

// Builds a GCSClient from the configuration, impersonating a service account
// when one is configured
std::unique_ptr<IObjectTransport> makeGCSTransport(const CacheConfig& config);

/**
 * Same as makeGCSTransport(config), exchanging the role through the given
 * IAM client
 *
 * @throws std::invalid_argument if impersonation is configured and iam is null
 * @throws AuthorizationError if the role exchange fails
 */
std::unique_ptr<IObjectTransport> makeGCSTransport(const CacheConfig& config,
                                                   const IIAMCredentialsSDKClient* iam);

/**
 * StoreEnumerator - Lists a store into a caller-chosen result type
 */
template <typename T>
class StoreEnumerator {
public:
    StoreEnumerator(RemoteStore& store, EntryAdapter<T> adapter)
        : store_(store), adapter_(std::move(adapter)) {}

    ObjectStream<T> ls(const std::string& prefix = "") const {
        return ObjectStream<T>(prefix, store_.pageFetcher(prefix), adapter_);
    }

    std::vector<ObjectStream<T>> ls(const std::vector<std::string>& prefixes) const {
        std::vector<ObjectStream<T>> streams;
        streams.reserve(prefixes.size());
        for (const auto& prefix : prefixes) {
            streams.push_back(ls(prefix));
        }
        return streams;
    }

private:
    RemoteStore& store_;
    EntryAdapter<T> adapter_;
};

// Adapter yielding the raw listing entries
inline ObjectEntry identityEntry(const ObjectEntry& entry) {
    return entry;
}

std::ostream& operator<<(std::ostream& os, const RemoteStore& store);

} // namespace gcscache
