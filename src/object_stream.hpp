#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <cstddef>
#include "object_transport.hpp"
#include "errors.hpp"

namespace gcscache {

// Fetches one listing page; an empty token requests the first page
using PageFetcher = std::function<StatusOr<ListPage>(const std::optional<std::string>& continuation_token)>;

// Converts a raw listing entry into the caller-visible result type
template <typename T>
using EntryAdapter = std::function<T(const ObjectEntry&)>;

/**
 * ObjectStream - Lazy, single-pass sequence over every object of one prefix
 *
 * Pages are pulled on demand: page N+1 is requested with page N's
 * continuation token only once the caller has consumed page N. Every entry
 * of every page goes through the same adapter. A transport failure puts the
 * stream into a terminal failed state and is raised as ListingError.
 */
template <typename T>
class ObjectStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(ObjectStream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return stream_ != other.stream_; }

    private:
        void advance() {
            if (stream_ != nullptr && stream_->hasNext()) {
                current_.emplace(stream_->next());
            } else {
                stream_ = nullptr;
                current_.reset();
            }
        }

        ObjectStream* stream_ = nullptr;
        std::optional<T> current_;
    };

    ObjectStream(std::string prefix, PageFetcher fetcher, EntryAdapter<T> adapter)
        : prefix_(std::move(prefix)),
          fetcher_(std::move(fetcher)),
          adapter_(std::move(adapter)) {}

    ObjectStream(ObjectStream&&) = default;
    ObjectStream& operator=(ObjectStream&&) = default;
    ObjectStream(const ObjectStream&) = delete;
    ObjectStream& operator=(const ObjectStream&) = delete;

    // Fetches further pages as needed. Throws ListingError if the transport fails.
    bool hasNext() {
        while (pos_ >= page_.size()) {
            if (!status_.ok()) {
                throw ListingError(prefix_, status_);
            }
            if (!more_pages_) {
                return false;
            }
            fetchPage();
        }
        return true;
    }

    T next() {
        if (!hasNext()) {
            throw std::out_of_range("No more objects under prefix '" + prefix_ + "'");
        }
        return adapter_(page_[pos_++]);
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    const std::string& prefix() const { return prefix_; }
    const Status& status() const { return status_; }
    std::size_t pagesFetched() const { return pages_fetched_; }

private:
    void fetchPage() {
        auto page = fetcher_(continuation_token_);
        ++pages_fetched_;
        page_.clear();
        pos_ = 0;
        if (!page) {
            more_pages_ = false;
            status_ = std::move(page).status();
            throw ListingError(prefix_, status_);
        }
        if (page->is_truncated && (!page->next_token || page->next_token->empty())) {
            more_pages_ = false;
            status_ = Status(google::cloud::StatusCode::kInternal,
                             "truncated page without a continuation token");
            throw ListingError(prefix_, status_);
        }
        page_ = std::move(page->entries);
        more_pages_ = page->is_truncated;
        if (more_pages_) {
            continuation_token_ = std::move(page->next_token);
        }
    }

    std::string prefix_;
    PageFetcher fetcher_;
    EntryAdapter<T> adapter_;

    std::vector<ObjectEntry> page_;
    std::size_t pos_ = 0;
    std::optional<std::string> continuation_token_;
    bool more_pages_ = true;
    Status status_;
    std::size_t pages_fetched_ = 0;
};

} // namespace gcscache
