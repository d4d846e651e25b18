#pragma once

#include <string>
#include <cstddef>
#include <stdexcept>

namespace benefice {

class FileError : public std::runtime_error {
public:
    explicit FileError(const std::string& message) : std::runtime_error(message) {}
};

// Uniquely named file in a staging directory, removed on destruction.
// Move-only; the moved-from object owns nothing.
class TempFile {
public:
    // Creates <dir>/benefice-<tag>-XXXXXX. Throws FileError.
    TempFile(const std::string& dir, const std::string& tag);
    ~TempFile();

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // Append bytes. Throws FileError on a short or failed write.
    void write(const char* data, size_t len);

    // Flush and close the descriptor; the file stays on disk
    void close();

    const std::string& path() const { return path_; }
    size_t size() const { return size_; }

private:
    std::string path_;
    int fd_ = -1;
    size_t size_ = 0;

    void remove();
};

class FileUtils {
public:
    // Read a whole file. Throws FileError.
    static std::string read_file(const std::string& filepath);

    // Hex SHA-256 of a file's contents. Throws FileError.
    static std::string sha256_file(const std::string& filepath);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Random (version 4) UUID in canonical 8-4-4-4-12 form
    static std::string generate_uuid();
};

} // namespace benefice
