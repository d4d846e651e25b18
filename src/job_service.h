#pragma once

#include <string>
#include <memory>
#include <optional>
#include "config.h"
#include "ports.h"
#include "job.h"
#include "sandbox.h"
#include "session.h"
#include "admission.h"
#include "ingest.h"
#include "rejection.h"
#include "timeout_scheduler.h"

namespace benefice {

struct CreateResult {
    std::string job_id;
    std::optional<Rejection> rejection;

    bool ok() const { return !rejection.has_value(); }
};

struct JobStatus {
    std::string user_id;
    bool starred = false;
    Limits::Decision limits{};
    std::string job_id;                // Empty when no job is running
    JobState state = JobState::REAPED;
    PortSet ports;
};

// Entry points of the web layer: create, delete, read output, status.
//
// Jobs keep pointers into the service's port registry and counter, so the
// service must outlive every session holding a job.
class JobService {
public:
    explicit JobService(const ServerConfig& config);
    ~JobService();

    JobService(const JobService&) = delete;
    JobService& operator=(const JobService&) = delete;

    // Cheap refusal before the upload body is read
    std::optional<Rejection> precheck(Session& session);

    // Upload bounds for the session's tier
    IngestLimits ingest_limits(const Session& session) const;

    // Validate the staged configuration, reserve its ports, admit and
    // spawn. Ports, the global slot and the staged files are released on
    // every refusal.
    CreateResult create(const SessionRef& session, StagedUpload upload);

    // Kill the session's job. Returns false when there was none.
    bool remove(Session& session);

    // Up to `capacity` bytes of the stream, waiting at most the read
    // deadline; nullopt when the session has no job. A job that has
    // exited is reaped once both of its streams reach end of file.
    std::optional<std::string> read(Session& session, Stream stream,
                                    size_t capacity = OUTPUT_READ_SIZE);

    JobStatus status(Session& session);

    const ServerConfig& config() const { return config_; }
    size_t max_jobs() const { return admission_.max_jobs(); }
    size_t live_jobs() const { return counter_.count(); }
    const PortRegistry& ports() const { return ports_; }
    TimeoutScheduler& scheduler() { return scheduler_; }

private:
    ServerConfig config_;
    PortRegistry ports_;
    JobCounter counter_;
    Sandbox sandbox_;
    AdmissionController admission_;
    TimeoutScheduler scheduler_;

    PortRegistry* registry() { return config_.shared_port_protections ? &ports_ : nullptr; }
    CreateResult refuse(Rejection rejection, const PortSet& reserved);
};

} // namespace benefice
