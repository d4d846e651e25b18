#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include "constants.h"

namespace benefice {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

// Inclusive range of listen ports a workload may declare
struct PortRange {
    uint16_t min = DEFAULT_PORT_MIN;
    uint16_t max = DEFAULT_PORT_MAX;

    bool contains(uint16_t port) const { return port >= min && port <= max; }
};

// Per-tier upload size and job lifetime
struct Limits {
    size_t size_limit_default_mib = DEFAULT_SIZE_LIMIT_MIB;
    size_t size_limit_starred_mib = STARRED_SIZE_LIMIT_MIB;
    std::chrono::seconds timeout_default{DEFAULT_TIMEOUT_SECONDS};
    std::chrono::seconds timeout_starred{STARRED_TIMEOUT_SECONDS};

    struct Decision {
        std::chrono::seconds ttl;
        size_t size_limit_bytes;
    };

    Decision decide(bool starred) const {
        if (starred) {
            return {timeout_starred, size_limit_starred_mib * MIB};
        }
        return {timeout_default, size_limit_default_mib * MIB};
    }
};

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int port = DEFAULT_HTTP_PORT;
    size_t max_jobs = 0;                          // 0 = hardware concurrency
    Limits limits;
    bool shared_port_protections = true;          // Track ports across running jobs
    PortRange port_range;
    std::string command = "enarx";                // Run as: <cmd> run --wasmcfgfile <toml> <wasm>
    std::set<std::string> starred_users;
    std::chrono::seconds session_ttl{SESSION_TTL_SECONDS};
    std::string staging_dir = "/tmp";
    bool seccomp = true;                          // Load the deny-list filter in workloads
    bool show_help = false;
};

// Parse command line into a config. Arguments of the form @path are
// replaced by the flags found in the JSON object stored at path.
// Throws ConfigError on unknown flags or bad values.
ServerConfig parse_args(const std::vector<std::string>& args);

// Expand a JSON config file into equivalent --flag=value arguments
std::vector<std::string> expand_config_file(const std::string& path);

std::string usage();

} // namespace benefice
