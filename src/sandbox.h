#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <linux/filter.h>
#include "constants.h"

namespace benefice {

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error("Sandbox setup failed: " + message) {}
};

struct SandboxPolicy {
    bool seccomp = true;                        // Deny host-administration syscalls
    int max_open_files = MAX_OPEN_FILES;
    bool allow_core_dumps = false;
};

// Restrictions applied to a workload between fork and exec.
//
// The seccomp program is compiled with libseccomp once, in the parent, and
// exported as raw BPF so that the child only performs async-signal-safe
// system calls after fork.
class Sandbox {
public:
    explicit Sandbox(const SandboxPolicy& policy = SandboxPolicy{});

    // Apply rlimits and install the filter in the calling (child) process.
    // Returns 0 or an errno value.
    int enter() const noexcept;

    const SandboxPolicy& policy() const { return policy_; }
    size_t filter_length() const { return program_.size(); }

    // Syscalls the filter refuses with EPERM
    static const std::vector<std::string>& denied_syscalls();

private:
    SandboxPolicy policy_;
    std::vector<sock_filter> program_;

    void compile_filter();
};

} // namespace benefice
