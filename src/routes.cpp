#include "routes.h"
#include <json/json.h>
#include <iostream>

namespace benefice {

namespace {

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

HttpResponse unauthorized() {
    return HttpResponse::error(401, "unauthorized", "Log in to manage workloads.");
}

HttpResponse rejected(const Session& session, const Rejection& rejection) {
    std::cout << "[http] rejected. user_id=" << session.user_id()
              << ", error=" << reject_reason_to_string(rejection.reason) << std::endl;
    HttpResponse resp;
    resp.status_code = rejection.http_status();
    resp.body = rejection.to_json();
    return resp;
}

SessionRef authenticate(const HttpRequest& req, SessionStore& sessions) {
    std::string user_id = req.header(USER_HEADER);
    if (user_id.empty()) {
        return nullptr;
    }
    return sessions.get_or_create(user_id);
}

HttpResponse output_route(const HttpRequest& req, JobService& service,
                          SessionStore& sessions, Stream stream) {
    SessionRef session = authenticate(req, sessions);
    if (!session) return unauthorized();

    auto output = service.read(*session, stream);
    if (!output) {
        return HttpResponse::error(404, "no_job", "No workload is running.");
    }

    HttpResponse resp;
    resp.headers["Content-Type"] = "application/octet-stream";
    resp.body = std::move(*output);
    return resp;
}

} // namespace

void register_routes(HttpServer& server, JobService& service, SessionStore& sessions) {
    server.route("GET", "/", [&service, &sessions](const HttpRequest& req) {
        HttpResponse resp;
        Json::Value json;
        json["server"]["jobs_running"] = static_cast<Json::UInt64>(service.live_jobs());
        json["server"]["max_jobs"] = static_cast<Json::UInt64>(service.max_jobs());

        SessionRef session = authenticate(req, sessions);
        if (!session) {
            json["authenticated"] = false;
            resp.body = to_json(json);
            return resp;
        }

        JobStatus status = service.status(*session);
        json["authenticated"] = true;
        json["user"] = status.user_id;
        json["starred"] = status.starred;
        json["limits"]["timeout_seconds"] = static_cast<Json::Int64>(status.limits.ttl.count());
        json["limits"]["size_limit_bytes"] = static_cast<Json::UInt64>(status.limits.size_limit_bytes);

        if (status.job_id.empty()) {
            json["job"] = Json::nullValue;
        } else {
            json["job"]["id"] = status.job_id;
            json["job"]["state"] = job_state_to_string(status.state);
            Json::Value ports(Json::arrayValue);
            for (uint16_t port : status.ports) {
                ports.append(static_cast<Json::UInt>(port));
            }
            json["job"]["ports"] = ports;
        }
        resp.body = to_json(json);
        return resp;
    });

    server.stream_route("POST", "/", [&service, &sessions](const HttpRequest& req) {
        SessionRef session = authenticate(req, sessions);
        if (!session) return unauthorized();

        // Refuse before reading the upload
        if (auto refusal = service.precheck(*session)) {
            return rejected(*session, *refusal);
        }

        IngestLimits limits = service.ingest_limits(*session);
        if (req.content_length > limits.workload_max + limits.config_max + MAX_REQUEST_SIZE) {
            return rejected(*session, Rejection::of(RejectReason::PAYLOAD_TOO_LARGE,
                "Upload exceeds the size limit of " + std::to_string(limits.workload_max) + " bytes."));
        }

        IngestResult ingested = ingest_upload(req.header("Content-Type"), *req.body_stream,
                                              limits, service.config().staging_dir);
        if (!ingested.ok()) {
            return rejected(*session, ingested.rejection);
        }

        CreateResult created = service.create(session, std::move(*ingested.staged));
        if (!created.ok()) {
            return rejected(*session, *created.rejection);
        }

        Json::Value json;
        json["job_id"] = created.job_id;

        HttpResponse resp;
        resp.status_code = 303;
        resp.headers["Location"] = "/";
        resp.body = to_json(json);
        return resp;
    });

    server.route("DELETE", "/", [&service, &sessions](const HttpRequest& req) {
        SessionRef session = authenticate(req, sessions);
        if (!session) return unauthorized();

        Json::Value json;
        json["deleted"] = service.remove(*session);

        HttpResponse resp;
        resp.body = to_json(json);
        return resp;
    });

    server.route("POST", "/out", [&service, &sessions](const HttpRequest& req) {
        return output_route(req, service, sessions, Stream::OUTPUT);
    });

    server.route("POST", "/err", [&service, &sessions](const HttpRequest& req) {
        return output_route(req, service, sessions, Stream::ERROR);
    });
}

} // namespace benefice
