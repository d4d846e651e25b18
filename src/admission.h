#pragma once

#include <optional>
#include "session.h"
#include "rejection.h"

namespace benefice {

// Global concurrency ceiling plus one job per user.
//
// precheck() refuses early, before an upload is read. reserve_slot() is
// the authoritative check and must run under the session write lock,
// immediately before the spawn it admits.
class AdmissionController {
public:
    AdmissionController(JobCounter& counter, size_t max_jobs);

    std::optional<Rejection> precheck(Session& session);

    // Reap an exited job, require an empty slot, then take one global
    // slot. On success the caller owns the slot: it passes to the spawned
    // Job, or is handed back through release_slot() if the spawn fails.
    std::optional<Rejection> reserve_slot(SessionData& data);

    void release_slot();

    size_t max_jobs() const { return max_jobs_; }
    size_t live_jobs() const { return counter_.count(); }

private:
    JobCounter& counter_;
    size_t max_jobs_;
};

} // namespace benefice
