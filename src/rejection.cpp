#include "rejection.h"
#include <json/json.h>

namespace benefice {

std::string reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::TOO_MANY_JOBS: return "too_many_jobs";
        case RejectReason::JOB_ALREADY_RUNNING: return "job_already_running";
        case RejectReason::ILLEGAL_PORTS: return "illegal_ports";
        case RejectReason::PORT_CONFLICT: return "port_conflict";
        case RejectReason::PAYLOAD_TOO_LARGE: return "payload_too_large";
        case RejectReason::UNSUPPORTED_MEDIA_TYPE: return "unsupported_media_type";
        case RejectReason::MALFORMED_UPLOAD: return "malformed_upload";
        case RejectReason::MALFORMED_CONFIG: return "malformed_config";
        case RejectReason::INTERNAL: return "internal";
    }
    return "internal";
}

Rejection Rejection::too_many_jobs(size_t limit) {
    return of(RejectReason::TOO_MANY_JOBS,
              "The server is running its maximum of " + std::to_string(limit) +
              " workloads. Please try again later.");
}

Rejection Rejection::job_already_running() {
    return of(RejectReason::JOB_ALREADY_RUNNING,
              "You already have a running workload. Delete it before starting another.");
}

Rejection Rejection::illegal_ports(const PortSet& ports, const PortRange& range) {
    Rejection r = of(RejectReason::ILLEGAL_PORTS,
                     "Listen port(s) " + format_ports(ports) + " are outside the allowed range " +
                     std::to_string(range.min) + "-" + std::to_string(range.max) + ".");
    r.ports = ports;
    r.range = range;
    return r;
}

Rejection Rejection::port_conflict(const PortSet& ports) {
    Rejection r = of(RejectReason::PORT_CONFLICT,
                     "Listen port(s) " + format_ports(ports) +
                     " are already in use by another workload.");
    r.ports = ports;
    return r;
}

Rejection Rejection::of(RejectReason reason, const std::string& message) {
    Rejection r;
    r.reason = reason;
    r.message = message;
    return r;
}

int Rejection::http_status() const {
    switch (reason) {
        case RejectReason::TOO_MANY_JOBS: return 429;
        case RejectReason::JOB_ALREADY_RUNNING: return 409;
        case RejectReason::ILLEGAL_PORTS: return 400;
        case RejectReason::PORT_CONFLICT: return 409;
        case RejectReason::PAYLOAD_TOO_LARGE: return 413;
        case RejectReason::UNSUPPORTED_MEDIA_TYPE: return 415;
        case RejectReason::MALFORMED_UPLOAD: return 400;
        case RejectReason::MALFORMED_CONFIG: return 400;
        case RejectReason::INTERNAL: return 500;
    }
    return 500;
}

std::string Rejection::to_json() const {
    Json::Value json;
    json["error"] = reject_reason_to_string(reason);
    json["message"] = message;

    if (reason == RejectReason::ILLEGAL_PORTS || reason == RejectReason::PORT_CONFLICT) {
        Json::Value list(Json::arrayValue);
        for (uint16_t port : ports) {
            list.append(static_cast<Json::UInt>(port));
        }
        json["ports"] = list;
    }
    if (reason == RejectReason::ILLEGAL_PORTS) {
        json["range"]["min"] = static_cast<Json::UInt>(range.min);
        json["range"]["max"] = static_cast<Json::UInt>(range.max);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
}

} // namespace benefice
