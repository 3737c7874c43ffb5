#pragma once

#include <string>

namespace gcscache {

// Local cache root of one bucket: <cache_dir>/<bucket_name>
std::string storeCacheRoot(const std::string& cache_dir, const std::string& bucket_name);

// Local path of one object: <store_cache_root>/<object_name>. Separators in
// the object name are kept, so nested names map to nested directories.
std::string cachePath(const std::string& store_cache_root, const std::string& object_name);

} // namespace gcscache
