#include "remote_store.hpp"
#include "cache_path.hpp"
#include "gcs/gcs_client.hpp"
#include "gcs/credentials.hpp"
#include "google/cloud/credentials.h"
#include "google/cloud/options.h"
#include <stdexcept>

namespace gcscache {

RemoteStore::RemoteStore(CacheConfig config, std::ostream* progress)
    : RemoteStore(std::move(config),
                  [](const CacheConfig& c) { return makeGCSTransport(c); },
                  progress) {}

RemoteStore::RemoteStore(CacheConfig config, TransportFactory transport_factory,
                         std::ostream* progress)
    : config_(std::move(config)),
      cache_root_(storeCacheRoot(config_.cache_dir, config_.bucket_name)),
      transport_factory_(std::move(transport_factory)),
      progress_(progress)
{
    config_.validate();
    if (config_.debug_mode) {
        std::cout << "[DEBUG] Cache root for " << config_.bucket_name << ": " << cache_root_ << std::endl;
    }
}

IObjectTransport& RemoteStore::transport() {
    if (!transport_) {
        if (config_.debug_mode) {
            std::cout << "[DEBUG] Creating transport for bucket: " << config_.bucket_name << std::endl;
        }
        transport_ = transport_factory_(config_);
        if (!transport_) {
            throw std::runtime_error("Transport factory returned no transport for " + config_.bucket_name);
        }
    }
    return *transport_;
}

ObjectStream<RemoteObject> RemoteStore::ls(const std::string& prefix) {
    return StoreEnumerator<RemoteObject>(*this, [](const ObjectEntry& entry) {
        return RemoteObject(entry);
    }).ls(prefix);
}

std::vector<ObjectStream<RemoteObject>> RemoteStore::ls(const std::vector<std::string>& prefixes) {
    return StoreEnumerator<RemoteObject>(*this, [](const ObjectEntry& entry) {
        return RemoteObject(entry);
    }).ls(prefixes);
}

PageFetcher RemoteStore::pageFetcher(const std::string& prefix) {
    return [this, prefix](const std::optional<std::string>& continuation_token) {
        auto& client = transport();
        say(".");
        return client.listPage(config_.bucket_name, prefix, continuation_token);
    };
}

void RemoteStore::say(const std::string& msg, int level) const {
    if (progress_ != nullptr && level < config_.verbosity) {
        *progress_ << msg << std::flush;
    }
}

std::string RemoteStore::toString() const {
    return "<RemoteStore(gs://" + config_.bucket_name + ")>";
}

std::ostream& operator<<(std::ostream& os, const RemoteStore& store) {
    return os << store.toString();
}

std::unique_ptr<IObjectTransport> makeGCSTransport(const CacheConfig& config) {
    if (config.impersonate_service_account.empty()) {
        return makeGCSTransport(config, nullptr);
    }
    IAMCredentialsSDKClientImpl iam;
    return makeGCSTransport(config, &iam);
}

std::unique_ptr<IObjectTransport> makeGCSTransport(const CacheConfig& config,
                                                   const IIAMCredentialsSDKClient* iam) {
    google::cloud::Options options;
    if (!config.endpoint.empty()) {
        options.set<gcs::RestEndpointOption>(config.endpoint);
    }
    if (!config.impersonate_service_account.empty()) {
        if (iam == nullptr) {
            throw std::invalid_argument("No IAM client to impersonate " + config.impersonate_service_account);
        }
        auto credentials = assumeRole(*iam, config.impersonate_service_account, config.session_name);
        if (config.debug_mode) {
            std::cout << "[DEBUG] Impersonating " << credentials.access_key_id << std::endl;
        }
        options.set<google::cloud::UnifiedCredentialsOption>(
            google::cloud::MakeAccessTokenCredentials(credentials.session_token, credentials.expiration));
    }
    return std::make_unique<GCSClient>(gcs::Client(std::move(options)), config.list_page_size);
}

} // namespace gcscache
