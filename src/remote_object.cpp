#include "remote_object.hpp"
#include <stdexcept>

namespace gcscache {

RemoteObject::RemoteObject(std::string key,
                           std::int64_t size,
                           std::chrono::system_clock::time_point modified,
                           std::string fingerprint)
    : key_(std::move(key)),
      size_(size),
      modified_(modified),
      fingerprint_(std::move(fingerprint))
{
    if (size_ < 0) {
        throw std::invalid_argument("Negative size for object " + key_);
    }
}

RemoteObject::RemoteObject(const ObjectEntry& entry)
    : RemoteObject(entry.key, entry.size, entry.last_modified, entry.fingerprint) {}

std::string RemoteObject::toString() const {
    return "<RemoteObject(" + key_ + ")>";
}

bool RemoteObject::operator==(const RemoteObject& other) const {
    return key_ == other.key_ && size_ == other.size_ &&
           modified_ == other.modified_ && fingerprint_ == other.fingerprint_;
}

std::ostream& operator<<(std::ostream& os, const RemoteObject& object) {
    return os << object.toString();
}

} // namespace gcscache
