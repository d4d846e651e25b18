#pragma once

#include <string>
#include "ports.h"
#include "config.h"

namespace benefice {

enum class RejectReason {
    TOO_MANY_JOBS,           // Global ceiling reached
    JOB_ALREADY_RUNNING,     // User already has a job
    ILLEGAL_PORTS,           // Declared ports outside the allowed range
    PORT_CONFLICT,           // Declared ports held by another job
    PAYLOAD_TOO_LARGE,
    UNSUPPORTED_MEDIA_TYPE,
    MALFORMED_UPLOAD,
    MALFORMED_CONFIG,
    INTERNAL
};

// Why a job was not created, structured enough for the web layer to
// render every case
struct Rejection {
    RejectReason reason = RejectReason::INTERNAL;
    std::string message;
    PortSet ports;           // Offending ports, for ILLEGAL_PORTS and PORT_CONFLICT
    PortRange range;         // Allowed range, for ILLEGAL_PORTS

    static Rejection too_many_jobs(size_t limit);
    static Rejection job_already_running();
    static Rejection illegal_ports(const PortSet& ports, const PortRange& range);
    static Rejection port_conflict(const PortSet& ports);
    static Rejection of(RejectReason reason, const std::string& message);

    // "try later" style refusal rather than a bad request
    bool is_capacity() const {
        return reason == RejectReason::TOO_MANY_JOBS || reason == RejectReason::JOB_ALREADY_RUNNING;
    }

    int http_status() const;

    // {"error": ..., "message": ..., "ports": [...], "range": {...}}
    std::string to_json() const;
};

std::string reject_reason_to_string(RejectReason reason);

} // namespace benefice
