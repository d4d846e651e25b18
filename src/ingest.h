#pragma once

#include <string>
#include <optional>
#include <cstddef>
#include <sys/types.h>
#include "file_utils.h"
#include "rejection.h"
#include "constants.h"

namespace benefice {

// Source of request body bytes
class BodySource {
public:
    virtual ~BodySource() = default;

    // Up to `capacity` bytes; 0 at end of body, -1 on a transport error
    virtual ssize_t read(char* buffer, size_t capacity) = 0;
};

// Body held in memory, handed out in chunks of at most `chunk` bytes
class StringBodySource : public BodySource {
public:
    explicit StringBodySource(std::string body, size_t chunk = PIPE_BUFFER_SIZE)
        : body_(std::move(body)), chunk_(chunk) {}

    ssize_t read(char* buffer, size_t capacity) override;

    size_t consumed() const { return offset_; }

private:
    std::string body_;
    size_t chunk_;
    size_t offset_ = 0;
};

struct IngestLimits {
    size_t workload_max = DEFAULT_SIZE_LIMIT_MIB * MIB;
    size_t config_max = CONFIG_MAX_BYTES;
};

// Both artifacts of a job submission, written to disk and closed
struct StagedUpload {
    TempFile workload;
    TempFile config;
};

struct IngestResult {
    std::optional<StagedUpload> staged;
    Rejection rejection;

    bool ok() const { return staged.has_value(); }
};

// Stream a multipart/form-data body into two bounded temporary files.
// The `wasm` part must be application/wasm, the `toml` part must carry
// no content type, each appears exactly once, and each is cut off as
// soon as it exceeds its limit. Unknown parts are skipped.
IngestResult ingest_upload(const std::string& content_type,
                           BodySource& body,
                           const IngestLimits& limits,
                           const std::string& staging_dir);

} // namespace benefice
