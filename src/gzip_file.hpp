#pragma once

#include <string>
#include <cstddef>
#include <zlib.h>

namespace gcscache {

/**
 * Access modes accepted by GzipFile
 *
 * Parsed from fopen-style strings: "r", "w", "a", "x", each optionally
 * suffixed with "b" or "t". Text and binary are equivalent here.
 */
enum class AccessMode {
    kRead,
    kWrite,      // create or truncate
    kAppend,     // create or append a new gzip member
    kExclusive   // create, fail if the file exists
};

// Throws std::invalid_argument for unrecognized mode strings
AccessMode parseAccessMode(const std::string& mode);

/**
 * GzipFile - RAII handle over a file read and written through zlib
 *
 * Reads decompress gzip content and pass plain content through unchanged.
 * Writes always produce gzip. The underlying descriptor is closed by the
 * destructor on every exit path.
 */
class GzipFile {
public:
    GzipFile(const std::string& path, AccessMode mode);
    ~GzipFile();

    GzipFile(GzipFile&& other) noexcept;
    GzipFile& operator=(GzipFile&& other) noexcept;
    GzipFile(const GzipFile&) = delete;
    GzipFile& operator=(const GzipFile&) = delete;

    // Returns the number of decompressed bytes read, 0 at end of file
    std::size_t read(char* buf, std::size_t size);

    // Read the remaining content
    std::string readAll();

    // Read one line without its trailing newline; false at end of file
    bool readLine(std::string& line);

    void write(const std::string& data);

    void flush();
    void close();

    bool isOpen() const { return file_ != nullptr; }
    AccessMode mode() const { return mode_; }
    const std::string& path() const { return path_; }

private:
    void requireOpen(const char* operation) const;
    std::string lastError() const;

    gzFile file_ = nullptr;
    std::string path_;
    AccessMode mode_;
};

} // namespace gcscache
