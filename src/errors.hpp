#pragma once

#include <stdexcept>
#include <string>
#include "google/cloud/status.h"

namespace gcscache {

/**
 * StatusError - Exception carrying the transport status that caused it
 */
class StatusError : public std::runtime_error {
public:
    StatusError(const std::string& what, google::cloud::Status status)
        : std::runtime_error(what + ": " + status.message()),
          status_(std::move(status)) {}

    const google::cloud::Status& status() const { return status_; }

private:
    google::cloud::Status status_;
};

// Listing a prefix failed; the affected stream is terminated
class ListingError : public StatusError {
public:
    ListingError(const std::string& prefix, google::cloud::Status status)
        : StatusError("Error listing prefix '" + prefix + "'", std::move(status)),
          prefix_(prefix) {}

    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

// Materializing an object into the local cache failed
class DownloadError : public StatusError {
public:
    DownloadError(const std::string& object_name, const std::string& path,
                  google::cloud::Status status)
        : StatusError("Error downloading " + object_name + " to " + path, std::move(status)),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Temporary credentials could not be obtained
class AuthorizationError : public StatusError {
public:
    AuthorizationError(const std::string& role, google::cloud::Status status)
        : StatusError("Cannot assume role " + role, std::move(status)) {}
};

} // namespace gcscache
