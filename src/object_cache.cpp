#include "object_cache.hpp"
#include "cache_path.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace gcscache {

ObjectCache::ObjectCache(RemoteStore& store) : store_(store) {}

std::string ObjectCache::cachePath(const RemoteObject& object) const {
    return gcscache::cachePath(store_.cacheRoot(), object.key());
}

bool ObjectCache::isCached(const RemoteObject& object) const {
    std::error_code ec;
    return fs::is_regular_file(cachePath(object), ec);
}

GzipFile ObjectCache::open(const RemoteObject& object, const std::string& mode) {
    const AccessMode access = parseAccessMode(mode);
    const std::string path = cachePath(object);

    // Appending extends the remote content, so it needs the local copy too
    if (access == AccessMode::kRead || access == AccessMode::kAppend) {
        if (isCached(object)) {
            if (store_.config().debug_mode) {
                std::cout << "[DEBUG] Cache hit for: " << object.key() << std::endl;
            }
        } else {
            if (store_.config().debug_mode) {
                std::cout << "[DEBUG] Cache miss for: " << object.key() << std::endl;
            }
            auto result = materialize(object);
            if (!result.ok() &&
                store_.config().download_failure_policy == DownloadFailurePolicy::kPropagate) {
                std::error_code ec;
                fs::remove(result.path, ec);
                throw DownloadError(object.key(), result.path, result.status);
            }
        }
    } else {
        ensureParentDirectory(path);
    }

    return GzipFile(path, access);
}

void ObjectCache::clearCached(const RemoteObject& object) {
    if (isCached(object)) {
        fs::remove(cachePath(object));
    }
}

MaterializeResult ObjectCache::materialize(const RemoteObject& object) {
    MaterializeResult result;
    result.path = cachePath(object);

    auto& transport = store_.transport();

    try {
        ensureParentDirectory(result.path);
    } catch (const std::exception& e) {
        result.status = Status(google::cloud::StatusCode::kInternal, e.what());
        store_.say("Error downloading file: " + result.status.message() + "\n");
        return result;
    }

    std::ofstream out(result.path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.status = Status(google::cloud::StatusCode::kInternal,
                               "Cannot open " + result.path + " for writing");
        store_.say("Error downloading file: " + result.status.message() + "\n");
        return result;
    }

    store_.say(".");
    result.status = transport.download(store_.bucketName(), object.key(), out);

    out.close();
    if (result.status.ok() && !out) {
        result.status = Status(google::cloud::StatusCode::kDataLoss,
                               "Error writing " + result.path);
    }

    if (!result.ok()) {
        store_.say("Error downloading file: " + result.status.message() + "\n");
    } else if (store_.config().debug_mode) {
        std::cout << "[DEBUG] Cached " << object.key() << " at " << result.path << std::endl;
    }
    return result;
}

void ObjectCache::ensureParentDirectory(const std::string& path) const {
    const auto parent = fs::path(path).parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace gcscache
