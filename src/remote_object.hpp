#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <ostream>
#include "object_transport.hpp"

namespace gcscache {

/**
 * RemoteObject - Immutable descriptor of one listed object
 *
 * A transient view over remote state at enumeration time. The fingerprint
 * (entity tag) is kept for display only and plays no part in cache
 * coherency.
 */
class RemoteObject {
public:
    RemoteObject(std::string key,
                 std::int64_t size,
                 std::chrono::system_clock::time_point modified,
                 std::string fingerprint);

    explicit RemoteObject(const ObjectEntry& entry);

    const std::string& key() const { return key_; }
    std::int64_t size() const { return size_; }
    std::chrono::system_clock::time_point modified() const { return modified_; }
    const std::string& fingerprint() const { return fingerprint_; }

    std::string toString() const;

    bool operator==(const RemoteObject& other) const;
    bool operator!=(const RemoteObject& other) const { return !(*this == other); }

private:
    std::string key_;
    std::int64_t size_;
    std::chrono::system_clock::time_point modified_;
    std::string fingerprint_;
};

std::ostream& operator<<(std::ostream& os, const RemoteObject& object);

} // namespace gcscache
