#include "job_service.h"
#include <thread>
#include <iostream>

namespace benefice {

namespace {

size_t effective_max_jobs(size_t configured) {
    if (configured > 0) return configured;
    size_t cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 1;
}

SandboxPolicy sandbox_policy(const ServerConfig& config) {
    SandboxPolicy policy;
    policy.seccomp = config.seccomp;
    return policy;
}

} // namespace

JobService::JobService(const ServerConfig& config)
    : config_(config),
      sandbox_(sandbox_policy(config)),
      admission_(counter_, effective_max_jobs(config.max_jobs)) {}

JobService::~JobService() {
    scheduler_.shutdown();
}

std::optional<Rejection> JobService::precheck(Session& session) {
    return admission_.precheck(session);
}

IngestLimits JobService::ingest_limits(const Session& session) const {
    IngestLimits limits;
    limits.workload_max = config_.limits.decide(session.starred()).size_limit_bytes;
    limits.config_max = CONFIG_MAX_BYTES;
    return limits;
}

CreateResult JobService::refuse(Rejection rejection, const PortSet& reserved) {
    if (!reserved.empty() && registry()) {
        ports_.release(reserved);
    }
    CreateResult result;
    result.rejection = std::move(rejection);
    return result;
}

CreateResult JobService::create(const SessionRef& session, StagedUpload upload) {
    auto decision = config_.limits.decide(session->starred());

    std::string config_text;
    std::string wasm_sha256;
    try {
        config_text = FileUtils::read_file(upload.config.path());
        wasm_sha256 = FileUtils::sha256_file(upload.workload.path());
    } catch (const FileError& e) {
        return refuse(Rejection::of(RejectReason::INTERNAL, e.what()), {});
    }

    PortSet ports;
    try {
        ports = parse_listen_ports(config_text);
    } catch (const ConfigParseError& e) {
        return refuse(Rejection::of(RejectReason::MALFORMED_CONFIG, e.what()), {});
    }

    PortSet illegal = find_illegal_ports(ports, config_.port_range);
    if (!illegal.empty()) {
        return refuse(Rejection::illegal_ports(illegal, config_.port_range), {});
    }

    std::string job_id = FileUtils::generate_uuid();

    PortSet reserved;
    if (registry()) {
        PortSet conflicts = ports_.try_reserve(ports, job_id);
        if (!conflicts.empty()) {
            std::cout << "[ports] conflict. user_id=" << session->user_id()
                      << ", ports=" << format_ports(conflicts) << std::endl;
            return refuse(Rejection::port_conflict(conflicts), {});
        }
        reserved = ports;
    }

    {
        auto data = session->write();

        auto refusal = admission_.reserve_slot(*data);
        if (refusal) {
            return refuse(*refusal, reserved);
        }

        JobResources resources;
        resources.ports = registry();
        resources.counter = &counter_;
        resources.sandbox = &sandbox_;

        std::unique_ptr<Job> job;
        try {
            job = Job::spawn(job_id, config_.command, std::move(upload.workload),
                             std::move(upload.config), ports, resources);
        } catch (const SpawnError& e) {
            admission_.release_slot();
            std::cerr << "[jobs] " << e.what() << std::endl;
            return refuse(Rejection::of(RejectReason::INTERNAL, e.what()), reserved);
        }
        data->install(std::move(job));
    }

    scheduler_.arm_job_timeout(session, job_id, decision.ttl);

    std::cout << "[jobs] job started. job_id=" << job_id
              << ", user_id=" << session->user_id()
              << ", wasm_sha256=" << wasm_sha256 << std::endl;

    CreateResult result;
    result.job_id = job_id;
    return result;
}

bool JobService::remove(Session& session) {
    auto data = session.write();
    if (!data->has_job()) {
        return false;
    }

    std::cout << "[jobs] job killed. job_id=" << data->job_id()
              << ", user_id=" << session.user_id() << std::endl;
    data->kill_job(JobState::KILLED);
    scheduler_.cancel_job_timeout(session);
    return true;
}

std::optional<std::string> JobService::read(Session& session, Stream stream, size_t capacity) {
    auto data = session.write();
    Job* job = data->job();
    if (!job) {
        return std::nullopt;
    }

    std::string output(capacity, '\0');
    size_t n = job->read(stream, &output[0], capacity);
    output.resize(n);

    // Keep the job until both streams are read to the end
    if (n == 0 && job->has_exited() && job->drained()) {
        data->kill_job(JobState::EXITED);
        scheduler_.cancel_job_timeout(session);
    }
    return output;
}

JobStatus JobService::status(Session& session) {
    JobStatus status;
    status.user_id = session.user_id();
    status.starred = session.starred();
    status.limits = config_.limits.decide(session.starred());

    auto data = session.write();
    if (data->reap_if_exited()) {
        scheduler_.cancel_job_timeout(session);
    }
    if (const Job* job = data->job()) {
        status.job_id = job->id();
        status.state = job->state();
        status.ports = job->ports();
    }
    return status;
}

} // namespace benefice
