#include "sandbox.h"
#include <seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <linux/seccomp.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace benefice {

const std::vector<std::string>& Sandbox::denied_syscalls() {
    static const std::vector<std::string> denied = {
        "ptrace", "process_vm_readv", "process_vm_writev",
        "mount", "umount2", "pivot_root", "chroot",
        "reboot", "kexec_load", "kexec_file_load",
        "init_module", "finit_module", "delete_module",
        "swapon", "swapoff", "acct", "settimeofday", "clock_settime"
    };
    return denied;
}

Sandbox::Sandbox(const SandboxPolicy& policy) : policy_(policy) {
    if (policy_.seccomp) {
        compile_filter();
    }
}

void Sandbox::compile_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        throw SandboxError("seccomp_init");
    }

    for (const auto& name : denied_syscalls()) {
        int nr = seccomp_syscall_resolve_name(name.c_str());
        if (nr == __NR_SCMP_ERROR) {
            continue;  // Not present on this architecture
        }
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), nr, 0);
        if (rc < 0) {
            seccomp_release(ctx);
            throw SandboxError("seccomp_rule_add(" + name + "): " + std::strerror(-rc));
        }
    }

    int fd = memfd_create("benefice-seccomp", MFD_CLOEXEC);
    if (fd < 0) {
        seccomp_release(ctx);
        throw SandboxError(std::string("memfd_create: ") + std::strerror(errno));
    }

    int rc = seccomp_export_bpf(ctx, fd);
    seccomp_release(ctx);
    if (rc < 0) {
        close(fd);
        throw SandboxError(std::string("seccomp_export_bpf: ") + std::strerror(-rc));
    }

    off_t size = lseek(fd, 0, SEEK_END);
    if (size <= 0 || size % static_cast<off_t>(sizeof(sock_filter)) != 0) {
        close(fd);
        throw SandboxError("exported filter has unexpected size");
    }

    program_.resize(static_cast<size_t>(size) / sizeof(sock_filter));
    ssize_t n = pread(fd, program_.data(), static_cast<size_t>(size), 0);
    close(fd);
    if (n != size) {
        program_.clear();
        throw SandboxError("failed to read exported filter");
    }
}

int Sandbox::enter() const noexcept {
    struct rlimit limit;

    if (!policy_.allow_core_dumps) {
        limit.rlim_cur = limit.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &limit) != 0) return errno;
    }

    if (policy_.max_open_files > 0) {
        if (getrlimit(RLIMIT_NOFILE, &limit) != 0) return errno;
        rlim_t wanted = static_cast<rlim_t>(policy_.max_open_files);
        if (limit.rlim_max == RLIM_INFINITY || limit.rlim_max > wanted) {
            limit.rlim_max = wanted;
        }
        limit.rlim_cur = limit.rlim_max;
        if (setrlimit(RLIMIT_NOFILE, &limit) != 0) return errno;
    }

    if (!program_.empty()) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return errno;

        struct sock_fprog prog;
        prog.len = static_cast<unsigned short>(program_.size());
        prog.filter = const_cast<sock_filter*>(program_.data());
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) != 0) return errno;
    }

    return 0;
}

} // namespace benefice
