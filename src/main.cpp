/*
 * Benefice - supervised WebAssembly workload server
 * One workload per user, streamed uploads, output served on demand
 */

#include "config.h"
#include "http_server.h"
#include "job_service.h"
#include "routes.h"
#include "session.h"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <string>
#include <csignal>
#include <memory>

using namespace benefice;

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << usage();
        return 2;
    }

    if (config.show_help) {
        std::cout << usage();
        return 0;
    }

    // Clients that hang up mid-response must not take the server down
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "Benefice - Supervised Workload Server" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    // Declared before the session store: jobs reference its registries
    std::unique_ptr<JobService> service;
    try {
        service = std::make_unique<JobService>(config);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    SessionStore sessions(config.session_ttl, config.starred_users);

    std::cout << "Command:        " << config.command << std::endl;
    std::cout << "Max jobs:       " << service->max_jobs() << std::endl;
    std::cout << "Listen ports:   " << config.port_range.min << "-" << config.port_range.max
              << (config.shared_port_protections ? " (shared-port protection on)" : "") << std::endl;
    std::cout << "Limits:         " << config.limits.size_limit_default_mib << " MiB / "
              << config.limits.timeout_default.count() << " s, starred "
              << config.limits.size_limit_starred_mib << " MiB / "
              << config.limits.timeout_starred.count() << " s" << std::endl;
    std::cout << "Seccomp:        " << (config.seccomp ? "enabled" : "disabled") << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    // Create HTTP server
    HttpServer server(config.port, config.bind_address);
    register_routes(server, *service, sessions);

    // Drop idle sessions (and with them any job nobody will come back for)
    std::thread sweeper([&sessions]() {
        while (true) {
            std::this_thread::sleep_for(std::chrono::minutes(1));
            size_t expired = sessions.expire_idle();
            if (expired > 0) {
                std::cout << "[sessions] expired " << expired << " idle session(s)" << std::endl;
            }
        }
    });
    sweeper.detach();

    std::cout << "API endpoints:" << std::endl;
    std::cout << "  GET    /     - Session and job status" << std::endl;
    std::cout << "  POST   /     - Start a workload (multipart: wasm, toml)" << std::endl;
    std::cout << "  DELETE /     - Kill the running workload" << std::endl;
    std::cout << "  POST   /out  - Read workload stdout" << std::endl;
    std::cout << "  POST   /err  - Read workload stderr" << std::endl;
    std::cout << std::endl;

    // Start server (blocks)
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
