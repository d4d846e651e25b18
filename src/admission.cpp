#include "admission.h"

namespace benefice {

AdmissionController::AdmissionController(JobCounter& counter, size_t max_jobs)
    : counter_(counter), max_jobs_(max_jobs) {}

std::optional<Rejection> AdmissionController::precheck(Session& session) {
    if (counter_.count() >= max_jobs_) {
        return Rejection::too_many_jobs(max_jobs_);
    }

    auto data = session.write();
    data->reap_if_exited();
    if (data->has_job()) {
        return Rejection::job_already_running();
    }
    return std::nullopt;
}

std::optional<Rejection> AdmissionController::reserve_slot(SessionData& data) {
    data.reap_if_exited();
    if (data.has_job()) {
        return Rejection::job_already_running();
    }
    if (!counter_.try_acquire(max_jobs_)) {
        return Rejection::too_many_jobs(max_jobs_);
    }
    return std::nullopt;
}

void AdmissionController::release_slot() {
    counter_.release();
}

} // namespace benefice
