#include "file_utils.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <vector>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>

namespace benefice {

TempFile::TempFile(const std::string& dir, const std::string& tag) {
    std::string tmpl = dir + "/benefice-" + tag + "-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    fd_ = mkstemp(buf.data());
    if (fd_ < 0) {
        throw FileError("Failed to create temporary file in " + dir + ": " + std::strerror(errno));
    }
    fcntl(fd_, F_SETFD, FD_CLOEXEC);
    path_ = buf.data();
}

TempFile::~TempFile() {
    remove();
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), size_(other.size_) {
    other.path_.clear();
    other.fd_ = -1;
    other.size_ = 0;
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        size_ = other.size_;
        other.path_.clear();
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

void TempFile::write(const char* data, size_t len) {
    if (fd_ < 0) {
        throw FileError("Write to closed temporary file " + path_);
    }
    while (len > 0) {
        ssize_t n = ::write(fd_, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw FileError("Failed to write " + path_ + ": " + std::strerror(errno));
        }
        data += n;
        len -= static_cast<size_t>(n);
        size_ += static_cast<size_t>(n);
    }
}

void TempFile::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void TempFile::remove() {
    close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

std::string FileUtils::read_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw FileError("Failed to open " + filepath);
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw FileError("Failed to read " + filepath);
    }
    return content.str();
}

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string FileUtils::sha256_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw FileError("Failed to open " + filepath + " for hashing");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw FileError("Failed to initialise SHA-256");
    }

    char buffer[8192];
    bool ok = true;
    while (ok && (file.read(buffer, sizeof(buffer)) || file.gcount() > 0)) {
        ok = EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) == 1;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    ok = ok && !file.bad() && EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw FileError("Failed to hash " + filepath);
    }

    return bytes_to_hex(hash, hash_len);
}

std::string FileUtils::generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random job id");
    }
    bytes[6] = (bytes[6] & 0x0f) | 0x40;  // version 4
    bytes[8] = (bytes[8] & 0x3f) | 0x80;  // RFC 4122 variant

    std::string hex = bytes_to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace benefice
