/**
 * Workload lifecycle through the web surface
 *
 * Runs the real routes, job service and session store behind an HTTP
 * server on a loopback port, with a shell script standing in for the
 * workload runner.
 */

#include <gtest/gtest.h>
#include "routes.h"
#include "../test_support.h"
#include <json/json.h>
#include <thread>
#include <chrono>
#include <sstream>

namespace benefice {
namespace {

using test_support::ScratchDir;
using test_support::FormPart;
using test_support::listen_config;
using test_support::multipart_body;
using test_support::multipart_content_type;
using test_support::send_request;
using test_support::response_status;
using test_support::response_body;

const char* BOUNDARY = "----benefice-boundary-7MA4YWxkTrZu0gW";

Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors << "\n" << text;
    return root;
}

class JobLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.command = bin.runner("enarx.sh",
            "echo \"hello from $(basename \"$4\")\"; echo warming up >&2; exec sleep 30");
        config.staging_dir = staging.path();
        config.max_jobs = 4;
        config.seccomp = false;
        config.starred_users = {"carol"};

        service = std::make_unique<JobService>(config);
        sessions = std::make_unique<SessionStore>(config.session_ttl, config.starred_users);
        server = std::make_unique<HttpServer>(0, "127.0.0.1");
        register_routes(*server, *service, *sessions);

        server_thread = std::thread([this]() { server->start(); });
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server->listening() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(server->listening());
    }

    void TearDown() override {
        server->stop();
        if (server_thread.joinable()) server_thread.join();
        server.reset();
        sessions.reset();
        service.reset();
    }

    std::string request(const std::string& method, const std::string& path,
                        const std::string& user, const std::string& content_type = "",
                        const std::string& body = "") {
        std::string raw = method + " " + path + " HTTP/1.1\r\nHost: localhost\r\n";
        if (!user.empty()) raw += std::string(USER_HEADER) + ": " + user + "\r\n";
        if (!content_type.empty()) raw += "Content-Type: " + content_type + "\r\n";
        raw += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
        return send_request(server->port(), raw);
    }

    std::string upload(const std::string& user, const std::string& toml,
                       const std::string& wasm_type = WORKLOAD_CONTENT_TYPE) {
        std::string body = multipart_body(BOUNDARY, {
            FormPart{WORKLOAD_FIELD, wasm_type, "asm-module", "app.wasm"},
            FormPart{CONFIG_FIELD, "", toml, ""},
        });
        return request("POST", "/", user, multipart_content_type(BOUNDARY), body);
    }

    // Poll an output route until `needle` appears
    std::string read_until(const std::string& path, const std::string& user, const std::string& needle) {
        std::string collected;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (collected.find(needle) == std::string::npos &&
               std::chrono::steady_clock::now() < deadline) {
            std::string response = request("POST", path, user);
            if (response_status(response) != 200) break;
            collected += response_body(response);
        }
        return collected;
    }

    ScratchDir bin;
    ScratchDir staging;
    ServerConfig config;
    std::unique_ptr<JobService> service;
    std::unique_ptr<SessionStore> sessions;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
};

TEST_F(JobLifecycleTest, AnonymousStatus) {
    std::string response = request("GET", "/", "");
    ASSERT_EQ(response_status(response), 200) << response;

    Json::Value json = parse_json(response_body(response));
    EXPECT_FALSE(json["authenticated"].asBool());
    EXPECT_EQ(json["server"]["jobs_running"].asUInt(), 0u);
    EXPECT_EQ(json["server"]["max_jobs"].asUInt(), 4u);
}

TEST_F(JobLifecycleTest, MutatingRoutesRequireIdentity) {
    EXPECT_EQ(response_status(upload("", listen_config({5000}))), 401);
    EXPECT_EQ(response_status(request("DELETE", "/", "")), 401);
    EXPECT_EQ(response_status(request("POST", "/out", "")), 401);
    EXPECT_EQ(response_status(request("POST", "/err", "")), 401);
    EXPECT_EQ(service->live_jobs(), 0u);
}

TEST_F(JobLifecycleTest, DeployReadAndDelete) {
    // Given: alice uploads a workload listening on 5000
    std::string created = upload("alice", listen_config({5000}));
    ASSERT_EQ(response_status(created), 303) << created;
    EXPECT_NE(created.find("Location: /\r\n"), std::string::npos);
    std::string job_id = parse_json(response_body(created))["job_id"].asString();
    EXPECT_EQ(job_id.size(), 36u);

    // Then: the status page shows it
    Json::Value status = parse_json(response_body(request("GET", "/", "alice")));
    EXPECT_TRUE(status["authenticated"].asBool());
    EXPECT_EQ(status["user"].asString(), "alice");
    EXPECT_FALSE(status["starred"].asBool());
    EXPECT_EQ(status["limits"]["timeout_seconds"].asInt(), DEFAULT_TIMEOUT_SECONDS);
    EXPECT_EQ(status["job"]["id"].asString(), job_id);
    EXPECT_EQ(status["job"]["state"].asString(), "running");
    ASSERT_EQ(status["job"]["ports"].size(), 1u);
    EXPECT_EQ(status["job"]["ports"][0].asUInt(), 5000u);
    EXPECT_EQ(status["server"]["jobs_running"].asUInt(), 1u);

    // And: both output streams are readable
    EXPECT_NE(read_until("/out", "alice", "hello from").find("hello from benefice-wasm-"), std::string::npos);
    EXPECT_NE(read_until("/err", "alice", "warming up").find("warming up"), std::string::npos);

    // When: alice deletes it
    std::string deleted = request("DELETE", "/", "alice");
    ASSERT_EQ(response_status(deleted), 200) << deleted;
    EXPECT_TRUE(parse_json(response_body(deleted))["deleted"].asBool());

    // Then: there is nothing left to read and the staged files are gone
    std::string out = request("POST", "/out", "alice");
    EXPECT_EQ(response_status(out), 404) << out;
    EXPECT_TRUE(parse_json(response_body(request("GET", "/", "alice")))["job"].isNull());
    EXPECT_FALSE(parse_json(response_body(request("DELETE", "/", "alice")))["deleted"].asBool());
    EXPECT_EQ(staging.entries(), 0u);
    EXPECT_EQ(service->live_jobs(), 0u);
}

TEST_F(JobLifecycleTest, SecondUploadWhileRunningIsConflict) {
    ASSERT_EQ(response_status(upload("alice", listen_config({5000}))), 303);

    std::string second = upload("alice", listen_config({5001}));
    EXPECT_EQ(response_status(second), 409) << second;
    EXPECT_EQ(parse_json(response_body(second))["error"].asString(), "job_already_running");
    EXPECT_EQ(service->live_jobs(), 1u);
}

TEST_F(JobLifecycleTest, PortHeldByAnotherUserIsConflict) {
    ASSERT_EQ(response_status(upload("alice", listen_config({5000}))), 303);

    std::string response = upload("bob", listen_config({5000}));
    ASSERT_EQ(response_status(response), 409) << response;
    Json::Value json = parse_json(response_body(response));
    EXPECT_EQ(json["error"].asString(), "port_conflict");
    EXPECT_EQ(json["ports"][0].asUInt(), 5000u);

    // Bob can still deploy on a free port
    EXPECT_EQ(response_status(upload("bob", listen_config({5001}))), 303);
}

TEST_F(JobLifecycleTest, PortOutsideRangeIsBadRequest) {
    std::string response = upload("alice", listen_config({80}));
    ASSERT_EQ(response_status(response), 400) << response;

    Json::Value json = parse_json(response_body(response));
    EXPECT_EQ(json["error"].asString(), "illegal_ports");
    EXPECT_EQ(json["range"]["min"].asUInt(), static_cast<unsigned>(DEFAULT_PORT_MIN));
    EXPECT_EQ(json["range"]["max"].asUInt(), static_cast<unsigned>(DEFAULT_PORT_MAX));
    EXPECT_EQ(staging.entries(), 0u);
}

TEST_F(JobLifecycleTest, WrongWorkloadTypeIsUnsupported) {
    std::string response = upload("alice", listen_config({5000}), "application/octet-stream");
    EXPECT_EQ(response_status(response), 415) << response;
    EXPECT_EQ(service->live_jobs(), 0u);
}

TEST_F(JobLifecycleTest, NonMultipartBodyIsUnsupported) {
    std::string response = request("POST", "/", "alice", "application/json", "{}");
    EXPECT_EQ(response_status(response), 415) << response;
}

TEST_F(JobLifecycleTest, MissingConfigPartIsBadRequest) {
    std::string body = multipart_body(BOUNDARY, {
        FormPart{WORKLOAD_FIELD, WORKLOAD_CONTENT_TYPE, "module", "app.wasm"},
    });
    std::string response = request("POST", "/", "alice", multipart_content_type(BOUNDARY), body);
    ASSERT_EQ(response_status(response), 400) << response;
    EXPECT_EQ(parse_json(response_body(response))["error"].asString(), "malformed_upload");
}

TEST_F(JobLifecycleTest, DeclaredLengthOverLimitRefusedBeforeReading) {
    // The body is never read, so only the headers need to arrive
    size_t declared = DEFAULT_SIZE_LIMIT_MIB * MIB + CONFIG_MAX_BYTES + MAX_REQUEST_SIZE + 1;
    std::string raw = "POST / HTTP/1.1\r\n" + std::string(USER_HEADER) + ": alice\r\n"
                      "Content-Type: " + multipart_content_type(BOUNDARY) + "\r\n"
                      "Content-Length: " + std::to_string(declared) + "\r\n\r\n";

    std::string response = send_request(server->port(), raw);
    ASSERT_EQ(response_status(response), 413) << response;
    EXPECT_EQ(parse_json(response_body(response))["error"].asString(), "payload_too_large");
    EXPECT_EQ(staging.entries(), 0u);
}

TEST_F(JobLifecycleTest, StarredUserSeesLargerLimits) {
    Json::Value status = parse_json(response_body(request("GET", "/", "carol")));
    EXPECT_TRUE(status["starred"].asBool());
    EXPECT_EQ(status["limits"]["timeout_seconds"].asInt(), STARRED_TIMEOUT_SECONDS);
    EXPECT_EQ(status["limits"]["size_limit_bytes"].asUInt64(), STARRED_SIZE_LIMIT_MIB * MIB);
}

} // namespace
} // namespace benefice
