#include "timeout_scheduler.h"
#include <iostream>

namespace benefice {

TimeoutScheduler::TimeoutScheduler() : worker_([this]() { run(); }) {}

TimeoutScheduler::~TimeoutScheduler() {
    shutdown();
}

void TimeoutScheduler::push_locked(const std::string& key, Clock::duration delay, Task task) {
    Key at{Clock::now() + delay, next_sequence_++};
    if (!key.empty()) {
        auto it = keyed_.find(key);
        if (it != keyed_.end()) {
            queue_.erase(it->second);
            it->second = at;
        } else {
            keyed_.emplace(key, at);
        }
    }
    queue_.emplace(at, Entry{std::move(task), key});
}

void TimeoutScheduler::schedule(Clock::duration delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        push_locked(std::string(), delay, std::move(task));
    }
    cv_.notify_one();
}

void TimeoutScheduler::schedule_keyed(const std::string& key, Clock::duration delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        push_locked(key, delay, std::move(task));
    }
    cv_.notify_one();
}

bool TimeoutScheduler::cancel(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keyed_.find(key);
    if (it == keyed_.end()) return false;
    queue_.erase(it->second);
    keyed_.erase(it);
    return true;
}

void TimeoutScheduler::arm_job_timeout(const WeakSessionRef& session, const std::string& job_id,
                                       Clock::duration ttl) {
    SessionRef owner = session.lock();
    if (!owner) return;

    schedule_keyed(owner->user_id(), ttl, [session, job_id]() {
        reap_if_current(session, job_id);
    });
}

bool TimeoutScheduler::cancel_job_timeout(const Session& session) {
    return cancel(session.user_id());
}

bool TimeoutScheduler::reap_if_current(const WeakSessionRef& weak, const std::string& job_id) {
    SessionRef session = weak.lock();
    if (!session) {
        return false;  // Session already torn down
    }

    std::cout << "[timeout] timeout for: " << job_id << std::endl;
    auto data = session->write();
    if (data->job_id() != job_id) {
        return false;  // Killed or replaced in the meantime
    }
    data->kill_job(JobState::TIMED_OUT);
    return true;
}

size_t TimeoutScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimeoutScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    keyed_.clear();
}

void TimeoutScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = queue_.begin();
        auto deadline = next->first.first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Task task = std::move(next->second.task);
        if (!next->second.key.empty()) keyed_.erase(next->second.key);
        queue_.erase(next);

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[timeout] task failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

} // namespace benefice
