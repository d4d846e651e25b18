#include "ingest.h"
#include "multipart.h"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace benefice {

ssize_t StringBodySource::read(char* buffer, size_t capacity) {
    size_t n = std::min({capacity, chunk_, body_.size() - offset_});
    std::memcpy(buffer, body_.data() + offset_, n);
    offset_ += n;
    return static_cast<ssize_t>(n);
}

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Media type without parameters
std::string media_type(const std::string& content_type) {
    std::string type = content_type.substr(0, content_type.find(';'));
    size_t start = type.find_first_not_of(" \t");
    size_t end = type.find_last_not_of(" \t");
    if (start == std::string::npos) return "";
    return lower(type.substr(start, end - start + 1));
}

class UploadCollector : public MultipartStreamParser::Handler {
public:
    UploadCollector(const IngestLimits& limits, const std::string& staging_dir)
        : limits_(limits), staging_dir_(staging_dir) {}

    bool on_part_begin(const MultipartPart& part) override {
        if (part.name == WORKLOAD_FIELD) {
            if (workload_) {
                return reject(RejectReason::MALFORMED_UPLOAD, "Duplicate wasm part.");
            }
            if (!part.has_content_type || media_type(part.content_type) != WORKLOAD_CONTENT_TYPE) {
                return reject(RejectReason::UNSUPPORTED_MEDIA_TYPE,
                              "The wasm part must have content type application/wasm.");
            }
            return open(workload_, "wasm", limits_.workload_max);
        }

        if (part.name == CONFIG_FIELD) {
            if (config_) {
                return reject(RejectReason::MALFORMED_UPLOAD, "Duplicate toml part.");
            }
            if (part.has_content_type) {
                return reject(RejectReason::MALFORMED_UPLOAD,
                              "The toml part must not have a content type.");
            }
            return open(config_, "toml", limits_.config_max);
        }

        target_ = nullptr;  // Ignored part
        return true;
    }

    bool on_part_data(const char* data, size_t len) override {
        if (!target_) return true;

        if (target_->size() + len > limit_) {
            return reject(RejectReason::PAYLOAD_TOO_LARGE,
                          std::string(workload_ && target_ == &*workload_ ? "Workload" : "Configuration") +
                          " exceeds the size limit of " + std::to_string(limit_) + " bytes.");
        }
        try {
            target_->write(data, len);
        } catch (const FileError& e) {
            return reject(RejectReason::INTERNAL, e.what());
        }
        return true;
    }

    bool on_part_end() override {
        if (!target_) return true;
        try {
            target_->close();
        } catch (const FileError& e) {
            return reject(RejectReason::INTERNAL, e.what());
        }
        target_ = nullptr;
        return true;
    }

    std::optional<TempFile> workload_;
    std::optional<TempFile> config_;
    std::optional<Rejection> rejection_;

private:
    const IngestLimits& limits_;
    const std::string& staging_dir_;
    TempFile* target_ = nullptr;
    size_t limit_ = 0;

    bool open(std::optional<TempFile>& slot, const std::string& tag, size_t limit) {
        try {
            slot.emplace(staging_dir_, tag);
        } catch (const FileError& e) {
            return reject(RejectReason::INTERNAL, e.what());
        }
        target_ = &*slot;
        limit_ = limit;
        return true;
    }

    bool reject(RejectReason reason, const std::string& message) {
        rejection_ = Rejection::of(reason, message);
        return false;
    }
};

IngestResult refused(RejectReason reason, const std::string& message) {
    IngestResult result;
    result.rejection = Rejection::of(reason, message);
    return result;
}

} // namespace

IngestResult ingest_upload(const std::string& content_type,
                           BodySource& body,
                           const IngestLimits& limits,
                           const std::string& staging_dir) {
    if (media_type(content_type) != "multipart/form-data") {
        return refused(RejectReason::UNSUPPORTED_MEDIA_TYPE,
                       "Expected a multipart/form-data upload.");
    }
    std::string boundary = MultipartStreamParser::extract_boundary(content_type);
    if (boundary.empty()) {
        return refused(RejectReason::MALFORMED_UPLOAD, "Missing multipart boundary.");
    }

    UploadCollector collector(limits, staging_dir);
    MultipartStreamParser parser(boundary, collector);

    char buffer[PIPE_BUFFER_SIZE];
    while (!parser.done()) {
        ssize_t n = body.read(buffer, sizeof(buffer));
        if (n < 0) {
            return refused(RejectReason::MALFORMED_UPLOAD, "Failed to read request body.");
        }
        if (n == 0) break;

        if (!parser.feed(buffer, static_cast<size_t>(n))) {
            if (parser.aborted() && collector.rejection_) {
                IngestResult result;
                result.rejection = *collector.rejection_;
                return result;
            }
            return refused(RejectReason::MALFORMED_UPLOAD,
                           "Malformed multipart body: " + parser.error());
        }
    }

    if (!parser.done()) {
        return refused(RejectReason::MALFORMED_UPLOAD, "Truncated multipart body.");
    }
    if (!collector.workload_) {
        return refused(RejectReason::MALFORMED_UPLOAD, "Missing wasm part.");
    }
    if (!collector.config_) {
        return refused(RejectReason::MALFORMED_UPLOAD, "Missing toml part.");
    }

    IngestResult result;
    result.staged = StagedUpload{std::move(*collector.workload_), std::move(*collector.config_)};
    return result;
}

} // namespace benefice
