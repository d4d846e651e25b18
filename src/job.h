#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <sys/types.h>
#include "ports.h"
#include "file_utils.h"
#include "sandbox.h"
#include "constants.h"

namespace benefice {

class SpawnError : public std::runtime_error {
public:
    explicit SpawnError(const std::string& message)
        : std::runtime_error("Failed to spawn process: " + message) {}
};

class ReadError : public std::runtime_error {
public:
    explicit ReadError(const std::string& message)
        : std::runtime_error("Failed to read job output: " + message) {}
};

enum class Stream {
    OUTPUT,
    ERROR
};

// Created -> Running -> {Killed, TimedOut, Exited} -> Reaped
enum class JobState {
    RUNNING,
    KILLED,
    TIMED_OUT,
    EXITED,
    REAPED
};

std::string job_state_to_string(JobState state);

// Process-wide number of live jobs, used as the global admission ceiling
class JobCounter {
public:
    // Take one slot if fewer than limit are in use
    bool try_acquire(size_t limit);
    void release();
    size_t count() const { return live_.load(); }

private:
    std::atomic<size_t> live_{0};
};

// Everything a job needs from the rest of the server. `ports` is null
// when shared-port protection is disabled.
struct JobResources {
    PortRegistry* ports = nullptr;
    JobCounter* counter = nullptr;
    const Sandbox* sandbox = nullptr;
};

// One supervised workload process
class Job {
public:
    // Runs `<command> run --wasmcfgfile <config> <workload>` with stdout and
    // stderr captured. On success the job owns `ports` (already reserved in
    // the registry under `id`) and one acquired slot of the counter. On
    // SpawnError neither is taken over; the caller releases them.
    static std::unique_ptr<Job> spawn(const std::string& id,
                                      const std::string& command,
                                      TempFile workload,
                                      TempFile config,
                                      PortSet ports,
                                      const JobResources& resources);

    ~Job();

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    // Wait up to `timeout` for output on the stream and copy what is
    // available. Zero means nothing new (or the stream reached its end);
    // only a real I/O failure throws ReadError.
    size_t read(Stream stream, char* buffer, size_t capacity,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(READ_TIMEOUT_MS));

    // Terminate if running, release ports and the counter slot. Only the
    // first call (or natural-exit reap) has any effect.
    void kill(JobState reason = JobState::KILLED);

    // Non-blocking check for natural exit. The leader is left unreaped
    // so its pid keeps naming the process group until kill().
    bool has_exited();

    // Both output streams have reached end of file
    bool drained() const;

    const std::string& id() const { return id_; }
    pid_t pid() const { return pid_; }
    const PortSet& ports() const { return ports_; }
    JobState state() const;
    JobState termination() const;
    int exit_code() const;

private:
    Job(std::string id, pid_t pid, int stdout_fd, int stderr_fd,
        TempFile workload, TempFile config, PortSet ports, const JobResources& resources);

    std::string id_;
    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    TempFile workload_;
    TempFile config_;
    PortSet ports_;
    JobResources resources_;

    mutable std::mutex mutex_;
    bool exited_ = false;          // Leader has exited, still a zombie
    bool waited_ = false;          // Leader collected; its pid may be reused
    bool reaped_ = false;          // Ports and slot released
    int exit_code_ = -1;
    JobState termination_ = JobState::RUNNING;

    bool poll_exit_locked();
    void wait_locked();
    void close_streams_locked();
};

} // namespace benefice
