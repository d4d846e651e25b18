#pragma once

#include <string>
#include <set>
#include <map>
#include <mutex>
#include <cstdint>
#include <stdexcept>
#include "config.h"

namespace benefice {

using PortSet = std::set<uint16_t>;

class ConfigParseError : public std::runtime_error {
public:
    ConfigParseError(const std::string& message, size_t line)
        : std::runtime_error("Enarx.toml line " + std::to_string(line) + ": " + message),
          line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

// Extract the ports declared by `kind = "listen"` entries of the
// [[files]] array in an Enarx.toml. Throws ConfigParseError.
PortSet parse_listen_ports(const std::string& config_text);

// Every port outside the inclusive range
PortSet find_illegal_ports(const PortSet& ports, const PortRange& range);

std::string format_ports(const PortSet& ports);

// Global table of listen ports held by running jobs
class PortRegistry {
public:
    // Claim all ports for owner, or none of them. Returns the ports that
    // were already held; an empty result means the reservation succeeded.
    PortSet try_reserve(const PortSet& ports, const std::string& owner);

    // Drop the given ports. Ports that are not held are ignored.
    void release(const PortSet& ports);

    bool is_held(uint16_t port) const;
    std::string owner_of(uint16_t port) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<uint16_t, std::string> held_;
};

} // namespace benefice
