#include "cache_path.hpp"

namespace gcscache {

std::string storeCacheRoot(const std::string& cache_dir, const std::string& bucket_name) {
    return cache_dir + "/" + bucket_name;
}

std::string cachePath(const std::string& store_cache_root, const std::string& object_name) {
    return store_cache_root + "/" + object_name;
}

} // namespace gcscache
