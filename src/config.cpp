#include "config.h"
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <thread>
#include <limits>
#include <algorithm>

namespace benefice {

namespace {

unsigned long parse_number(const std::string& flag, const std::string& value,
                           unsigned long max = std::numeric_limits<unsigned long>::max()) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("invalid value for --" + flag + ": '" + value + "'");
    }
    unsigned long n;
    try {
        n = std::stoul(value);
    } catch (const std::exception&) {
        throw ConfigError("value out of range for --" + flag + ": '" + value + "'");
    }
    if (n > max) {
        throw ConfigError("value out of range for --" + flag + ": '" + value + "'");
    }
    return n;
}

bool parse_bool(const std::string& flag, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigError("invalid boolean for --" + flag + ": '" + value + "'");
}

void parse_addr(ServerConfig& config, const std::string& value) {
    size_t colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw ConfigError("--addr must be <host>:<port>, got '" + value + "'");
    }
    config.bind_address = value.substr(0, colon);
    config.port = static_cast<int>(parse_number("addr", value.substr(colon + 1), 65535));
}

bool is_bool_flag(const std::string& flag) {
    return flag == "shared-port-protections" || flag == "seccomp";
}

} // namespace

std::vector<std::string> expand_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("failed to read config file at '" + path + "'");
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw ConfigError("failed to parse config file at '" + path + "' as JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ConfigError("invalid config file format in file at '" + path + "'");
    }

    std::vector<std::string> args;
    for (const auto& key : root.getMemberNames()) {
        const Json::Value& value = root[key];
        if (value.isBool()) {
            args.push_back("--" + key + "=" + (value.asBool() ? "true" : "false"));
        } else if (value.isString()) {
            args.push_back("--" + key + "=" + value.asString());
        } else if (value.isUInt64()) {
            args.push_back("--" + key + "=" + std::to_string(value.asUInt64()));
        } else if (value.isArray()) {
            // Repeatable flags, e.g. "starred-user": ["alice", "bob"]
            for (const auto& item : value) {
                if (!item.isString()) {
                    throw ConfigError("unsupported array item for field '" + key +
                                      "' in config file at '" + path + "'");
                }
                args.push_back("--" + key + "=" + item.asString());
            }
        } else {
            throw ConfigError("unsupported value type for field '" + key +
                              "' in config file at '" + path + "'");
        }
    }
    return args;
}

ServerConfig parse_args(const std::vector<std::string>& raw) {
    std::vector<std::string> args;
    for (const auto& arg : raw) {
        if (!arg.empty() && arg[0] == '@') {
            auto expanded = expand_config_file(arg.substr(1));
            args.insert(args.end(), expanded.begin(), expanded.end());
        } else {
            args.push_back(arg);
        }
    }

    ServerConfig config;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("unexpected argument '" + arg + "'");
        }

        std::string flag = arg.substr(2);
        std::string value;
        size_t eq = flag.find('=');
        if (eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        } else if (is_bool_flag(flag)) {
            value = "true";
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            throw ConfigError("missing value for --" + flag);
        }

        if (flag == "addr") {
            parse_addr(config, value);
        } else if (flag == "jobs") {
            config.max_jobs = parse_number(flag, value);
        } else if (flag == "size-limit-default") {
            config.limits.size_limit_default_mib = parse_number(flag, value);
        } else if (flag == "size-limit-starred") {
            config.limits.size_limit_starred_mib = parse_number(flag, value);
        } else if (flag == "timeout-default") {
            config.limits.timeout_default = std::chrono::seconds(parse_number(flag, value));
        } else if (flag == "timeout-starred") {
            config.limits.timeout_starred = std::chrono::seconds(parse_number(flag, value));
        } else if (flag == "shared-port-protections") {
            config.shared_port_protections = parse_bool(flag, value);
        } else if (flag == "port-min") {
            config.port_range.min = static_cast<uint16_t>(parse_number(flag, value, 65535));
        } else if (flag == "port-max") {
            config.port_range.max = static_cast<uint16_t>(parse_number(flag, value, 65535));
        } else if (flag == "command") {
            config.command = value;
        } else if (flag == "starred-user") {
            config.starred_users.insert(value);
        } else if (flag == "session-ttl") {
            config.session_ttl = std::chrono::seconds(parse_number(flag, value));
        } else if (flag == "staging-dir") {
            config.staging_dir = value;
        } else if (flag == "seccomp") {
            config.seccomp = parse_bool(flag, value);
        } else {
            throw ConfigError("unknown option --" + flag);
        }
    }

    if (config.port_range.min > config.port_range.max) {
        throw ConfigError("--port-min must not exceed --port-max");
    }
    if (config.command.empty()) {
        throw ConfigError("--command must not be empty");
    }
    if (config.max_jobs == 0) {
        config.max_jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    return config;
}

std::string usage() {
    std::ostringstream out;
    out << "Usage: benefice [options] [@config.json]\n"
        << "  --addr <host:port>              Address to bind to (default 0.0.0.0:" << DEFAULT_HTTP_PORT << ")\n"
        << "  --jobs <n>                      Maximum concurrent jobs (default: CPU count)\n"
        << "  --size-limit-default <MiB>      Workload size limit (default " << DEFAULT_SIZE_LIMIT_MIB << ")\n"
        << "  --size-limit-starred <MiB>      Starred workload size limit (default " << STARRED_SIZE_LIMIT_MIB << ")\n"
        << "  --timeout-default <seconds>     Job timeout (default " << DEFAULT_TIMEOUT_SECONDS << ")\n"
        << "  --timeout-starred <seconds>     Starred job timeout (default " << STARRED_TIMEOUT_SECONDS << ")\n"
        << "  --shared-port-protections[=b]   Prevent two jobs listening on one port (default true)\n"
        << "  --port-min <port>               Lowest listen port allowed (default " << DEFAULT_PORT_MIN << ")\n"
        << "  --port-max <port>               Highest listen port allowed (default " << DEFAULT_PORT_MAX << ")\n"
        << "  --command <path>                Runner, executed as <cmd> run --wasmcfgfile <toml> <wasm>\n"
        << "  --starred-user <id>             User with the starred tier (repeatable)\n"
        << "  --session-ttl <seconds>         Idle session expiry (default " << SESSION_TTL_SECONDS << ")\n"
        << "  --staging-dir <path>            Directory for uploaded artifacts (default /tmp)\n"
        << "  --seccomp[=b]                   Load the syscall deny-list in workloads (default true)\n";
    return out.str();
}

} // namespace benefice
