#pragma once

#include <gmock/gmock.h>
#include <optional>
#include <ostream>
#include <string>
#include "object_transport.hpp"

namespace gcscache {

// Mock of the transport consumed by RemoteStore and ObjectCache
class MockObjectTransport : public IObjectTransport {
public:
    MOCK_METHOD(
        StatusOr<ListPage>,
        listPage,
        (const std::string& bucket_name, const std::string& prefix,
         const std::optional<std::string>& continuation_token),
        (const, override)
    );

    MOCK_METHOD(
        Status,
        download,
        (const std::string& bucket_name, const std::string& object_name,
         std::ostream& destination),
        (const, override)
    );
};

// Page of entries named <prefix><first>..<prefix><first + count - 1>
inline ListPage makePage(const std::string& prefix, int first, int count,
                         std::optional<std::string> next_token = std::nullopt) {
    ListPage page;
    for (int i = first; i < first + count; ++i) {
        ObjectEntry entry;
        entry.key = prefix + "obj-" + std::to_string(1000 + i);
        entry.size = i;
        entry.fingerprint = "\"etag-" + std::to_string(i) + "\"";
        page.entries.push_back(entry);
    }
    page.is_truncated = next_token.has_value();
    page.next_token = std::move(next_token);
    return page;
}

} // namespace gcscache
