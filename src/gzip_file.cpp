#include "gzip_file.hpp"
#include <stdexcept>
#include <climits>
#include <cerrno>
#include <cstring>
#include <utility>

namespace gcscache {

namespace {

constexpr std::size_t kReadChunkSize = 64 * 1024;

const char* zlibMode(AccessMode mode) {
    switch (mode) {
        case AccessMode::kRead:
            return "rb";
        case AccessMode::kWrite:
            return "wb";
        case AccessMode::kAppend:
            return "ab";
        case AccessMode::kExclusive:
            return "wbx";
    }
    return "rb";
}

} // namespace

AccessMode parseAccessMode(const std::string& mode) {
    if (mode.empty() || mode.size() > 2) {
        throw std::invalid_argument("Invalid file mode: '" + mode + "'");
    }
    if (mode.size() == 2 && mode[1] != 'b' && mode[1] != 't') {
        throw std::invalid_argument("Invalid file mode: '" + mode + "'");
    }
    switch (mode[0]) {
        case 'r':
            return AccessMode::kRead;
        case 'w':
            return AccessMode::kWrite;
        case 'a':
            return AccessMode::kAppend;
        case 'x':
            return AccessMode::kExclusive;
        default:
            throw std::invalid_argument("Invalid file mode: '" + mode + "'");
    }
}

GzipFile::GzipFile(const std::string& path, AccessMode mode)
    : path_(path), mode_(mode)
{
    file_ = gzopen(path.c_str(), zlibMode(mode));
    if (file_ == nullptr) {
        const int err = errno;
        throw std::runtime_error("Cannot open " + path + ": " +
                                 (err != 0 ? std::strerror(err) : "out of memory"));
    }
}

GzipFile::~GzipFile() {
    if (file_ != nullptr) {
        gzclose(file_);
    }
}

GzipFile::GzipFile(GzipFile&& other) noexcept
    : file_(std::exchange(other.file_, nullptr)),
      path_(std::move(other.path_)),
      mode_(other.mode_) {}

GzipFile& GzipFile::operator=(GzipFile&& other) noexcept {
    if (this != &other) {
        if (file_ != nullptr) {
            gzclose(file_);
        }
        file_ = std::exchange(other.file_, nullptr);
        path_ = std::move(other.path_);
        mode_ = other.mode_;
    }
    return *this;
}

std::size_t GzipFile::read(char* buf, std::size_t size) {
    requireOpen("read");
    if (mode_ != AccessMode::kRead) {
        throw std::logic_error(path_ + " is not open for reading");
    }
    if (size > static_cast<std::size_t>(INT_MAX)) {
        size = static_cast<std::size_t>(INT_MAX);
    }
    const int n = gzread(file_, buf, static_cast<unsigned>(size));
    if (n < 0) {
        throw std::runtime_error("Error reading " + path_ + ": " + lastError());
    }
    return static_cast<std::size_t>(n);
}

std::string GzipFile::readAll() {
    std::string content;
    char buf[kReadChunkSize];
    std::size_t n;
    while ((n = read(buf, sizeof(buf))) > 0) {
        content.append(buf, n);
    }
    return content;
}

bool GzipFile::readLine(std::string& line) {
    requireOpen("read");
    if (mode_ != AccessMode::kRead) {
        throw std::logic_error(path_ + " is not open for reading");
    }
    line.clear();
    char buf[4096];
    while (gzgets(file_, buf, sizeof(buf)) != nullptr) {
        line.append(buf);
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            return true;
        }
    }
    int errnum = Z_OK;
    gzerror(file_, &errnum);
    if (errnum != Z_OK && errnum != Z_BUF_ERROR) {
        throw std::runtime_error("Error reading " + path_ + ": " + lastError());
    }
    return !line.empty();
}

void GzipFile::write(const std::string& data) {
    requireOpen("write");
    if (mode_ == AccessMode::kRead) {
        throw std::logic_error(path_ + " is not open for writing");
    }
    if (data.empty()) {
        return;
    }
    const int n = gzwrite(file_, data.data(), static_cast<unsigned>(data.size()));
    if (n <= 0 || static_cast<std::size_t>(n) != data.size()) {
        throw std::runtime_error("Error writing " + path_ + ": " + lastError());
    }
}

void GzipFile::flush() {
    requireOpen("flush");
    if (mode_ != AccessMode::kRead && gzflush(file_, Z_SYNC_FLUSH) != Z_OK) {
        throw std::runtime_error("Error flushing " + path_ + ": " + lastError());
    }
}

void GzipFile::close() {
    if (file_ == nullptr) {
        return;
    }
    const int rc = gzclose(file_);
    file_ = nullptr;
    if (rc != Z_OK && rc != Z_BUF_ERROR) {
        throw std::runtime_error("Error closing " + path_ + " (zlib error " + std::to_string(rc) + ")");
    }
}

void GzipFile::requireOpen(const char* operation) const {
    if (file_ == nullptr) {
        throw std::logic_error(std::string("Cannot ") + operation + " closed file " + path_);
    }
}

std::string GzipFile::lastError() const {
    int errnum = Z_OK;
    const char* msg = gzerror(file_, &errnum);
    if (errnum == Z_ERRNO) {
        return std::strerror(errno);
    }
    return msg != nullptr ? msg : "unknown error";
}

} // namespace gcscache
