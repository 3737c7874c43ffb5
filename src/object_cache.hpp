#pragma once

#include <string>
#include "remote_store.hpp"
#include "remote_object.hpp"
#include "gzip_file.hpp"
#include "object_transport.hpp"

namespace gcscache {

/**
 * MaterializeResult - Outcome of one download into the cache
 *
 * On failure path names the (possibly partial) local file.
 */
struct MaterializeResult {
    std::string path;
    Status status;

    bool ok() const { return status.ok(); }
};

/**
 * ObjectCache - Read-through local cache of a RemoteStore's objects
 *
 * A regular file at <cache_root>/<key> is the only cache-hit signal. Entries
 * are never invalidated implicitly; they go away through clearCached only.
 * Concurrent callers materializing the same key are not coordinated.
 */
class ObjectCache {
public:
    explicit ObjectCache(RemoteStore& store);

    // Local path for the object, whether cached or not
    std::string cachePath(const RemoteObject& object) const;

    bool isCached(const RemoteObject& object) const;

    /**
     * Open the cached copy of an object through the gzip layer
     *
     * Read and append modes download the object first when it is not
     * cached. Write and exclusive modes create the file without downloading.
     *
     * @param object Object to open
     * @param mode One of r, w, a, x, optionally suffixed with b or t
     * @return Handle closed on destruction
     * @throws std::invalid_argument for an unrecognized mode
     * @throws DownloadError if the download fails and the policy is kPropagate
     */
    GzipFile open(const RemoteObject& object, const std::string& mode = "r");

    // Remove the cached copy; no-op if absent
    void clearCached(const RemoteObject& object);

    // Download the object into the cache, replacing any existing copy. Never
    // throws on transport failure: the status is returned.
    MaterializeResult materialize(const RemoteObject& object);

private:
    void ensureParentDirectory(const std::string& path) const;

    RemoteStore& store_;
};

} // namespace gcscache
