#pragma once

#include <string>
#include <map>
#include <utility>
#include <cstdint>
#include <mutex>
#include <thread>
#include <chrono>
#include <functional>
#include <condition_variable>
#include "session.h"

namespace benefice {

// Runs deferred tasks on a single background thread, in deadline order
class TimeoutScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    TimeoutScheduler();
    ~TimeoutScheduler();

    TimeoutScheduler(const TimeoutScheduler&) = delete;
    TimeoutScheduler& operator=(const TimeoutScheduler&) = delete;

    void schedule(Clock::duration delay, Task task);

    // Like schedule(), but replaces any task still pending under `key`
    void schedule_keyed(const std::string& key, Clock::duration delay, Task task);

    // Drop the task pending under `key`, if any
    bool cancel(const std::string& key);

    // Reap `job_id` from the session after `ttl`. Only a weak reference is
    // kept: a session with no other owner is left alone, and a slot that
    // by then holds a different job (or none) is not touched.
    // A session has at most one armed timeout; re-arming replaces it.
    void arm_job_timeout(const WeakSessionRef& session, const std::string& job_id,
                         Clock::duration ttl);
    bool cancel_job_timeout(const Session& session);

    size_t pending() const;

    // Stop the worker; tasks not yet due are discarded
    void shutdown();

    // The body of an armed job timeout, exposed for direct invocation
    static bool reap_if_current(const WeakSessionRef& session, const std::string& job_id);

private:
    using Key = std::pair<Clock::time_point, uint64_t>;  // Deadline, then arrival

    struct Entry {
        Task task;
        std::string key;  // Empty when unkeyed
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Entry> queue_;
    std::map<std::string, Key> keyed_;
    uint64_t next_sequence_ = 0;
    bool stopping_ = false;
    std::thread worker_;

    void push_locked(const std::string& key, Clock::duration delay, Task task);
    void run();
};

} // namespace benefice
