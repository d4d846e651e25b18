#pragma once

#include <string>
#include <set>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <chrono>
#include "job.h"

namespace benefice {

// Mutable per-user state, reachable only through Session guards
class SessionData {
public:
    Job* job() { return job_.get(); }
    const Job* job() const { return job_.get(); }
    bool has_job() const { return job_ != nullptr; }

    // Identifier of the current job, empty when the slot is free
    std::string job_id() const { return job_ ? job_->id() : std::string(); }

    void install(std::unique_ptr<Job> job) { job_ = std::move(job); }

    // Kill the current job (if any) and free the slot
    void kill_job(JobState reason = JobState::KILLED);

    // Free the slot if the job's process has exited on its own
    bool reap_if_exited();

private:
    std::unique_ptr<Job> job_;
};

// One user's server-side record. Shared through SessionRef (strong) and
// WeakSessionRef (weak); all access to the job slot goes through the
// read/write guards.
class Session {
public:
    template <typename Lock, typename Data>
    class Guard {
    public:
        Guard(Lock lock, Data& data) : lock_(std::move(lock)), data_(&data) {}
        Data* operator->() const { return data_; }
        Data& operator*() const { return *data_; }

    private:
        Lock lock_;
        Data* data_;
    };

    using WriteGuard = Guard<std::unique_lock<std::shared_mutex>, SessionData>;
    using ReadGuard = Guard<std::shared_lock<std::shared_mutex>, const SessionData>;

    Session(std::string user_id, bool starred);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    WriteGuard write() {
        return WriteGuard(std::unique_lock<std::shared_mutex>(mutex_), data_);
    }
    ReadGuard read() const {
        return ReadGuard(std::shared_lock<std::shared_mutex>(mutex_), data_);
    }

    const std::string& user_id() const { return user_id_; }
    bool starred() const { return starred_; }

private:
    const std::string user_id_;
    const bool starred_;
    mutable std::shared_mutex mutex_;
    SessionData data_;
};

using SessionRef = std::shared_ptr<Session>;
using WeakSessionRef = std::weak_ptr<Session>;

// Live sessions by user id. The store holds the long-lived strong
// reference; sessions idle for longer than the ttl are dropped.
class SessionStore {
public:
    SessionStore(std::chrono::seconds ttl, std::set<std::string> starred_users);

    // Existing session (refreshing its idle timer) or a new one
    SessionRef get_or_create(const std::string& user_id);

    // Drop every session idle for longer than the ttl. Returns the number dropped.
    size_t expire_idle();

    size_t size() const;

private:
    struct Entry {
        SessionRef session;
        std::chrono::steady_clock::time_point last_seen;
    };

    std::chrono::seconds ttl_;
    std::set<std::string> starred_users_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> sessions_;
};

} // namespace benefice
