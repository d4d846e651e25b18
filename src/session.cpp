#include "session.h"
#include <vector>
#include <iostream>

namespace benefice {

void SessionData::kill_job(JobState reason) {
    if (job_) {
        job_->kill(reason);
        job_.reset();
    }
}

bool SessionData::reap_if_exited() {
    if (job_ && job_->has_exited()) {
        job_->kill(JobState::EXITED);
        job_.reset();
        return true;
    }
    return false;
}

Session::Session(std::string user_id, bool starred)
    : user_id_(std::move(user_id)), starred_(starred) {}

Session::~Session() {
    // Nobody else can hold the lock once the last reference is gone
    data_.kill_job(JobState::KILLED);
}

SessionStore::SessionStore(std::chrono::seconds ttl, std::set<std::string> starred_users)
    : ttl_(ttl), starred_users_(std::move(starred_users)) {}

SessionRef SessionStore::get_or_create(const std::string& user_id) {
    // Expired sessions are released outside the store lock; dropping the
    // last reference may kill a job
    std::vector<SessionRef> expired;
    SessionRef session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();

        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->first != user_id && now - it->second.last_seen > ttl_) {
                expired.push_back(std::move(it->second.session));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }

        auto it = sessions_.find(user_id);
        if (it != sessions_.end() && now - it->second.last_seen > ttl_) {
            expired.push_back(std::move(it->second.session));
            sessions_.erase(it);
            it = sessions_.end();
        }
        if (it == sessions_.end()) {
            Entry entry;
            entry.session = std::make_shared<Session>(user_id, starred_users_.count(user_id) > 0);
            it = sessions_.emplace(user_id, std::move(entry)).first;
        }
        it->second.last_seen = now;
        session = it->second.session;
    }

    if (!expired.empty()) {
        std::cout << "[sessions] expired " << expired.size() << " idle session(s)" << std::endl;
    }
    return session;
}

size_t SessionStore::expire_idle() {
    std::vector<SessionRef> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.last_seen > ttl_) {
                expired.push_back(std::move(it->second.session));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return expired.size();
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace benefice
