#include "job.h"
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <vector>
#include <algorithm>
#include <iostream>
#include <cerrno>
#include <cstring>

namespace benefice {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Report errno to the parent through the status pipe and exit
[[noreturn]] void child_fail(int status_fd, int err) {
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

std::string job_state_to_string(JobState state) {
    switch (state) {
        case JobState::RUNNING: return "running";
        case JobState::KILLED: return "killed";
        case JobState::TIMED_OUT: return "timed_out";
        case JobState::EXITED: return "exited";
        case JobState::REAPED: return "reaped";
    }
    return "unknown";
}

bool JobCounter::try_acquire(size_t limit) {
    size_t current = live_.load();
    while (current < limit) {
        if (live_.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void JobCounter::release() {
    live_.fetch_sub(1);
}

std::unique_ptr<Job> Job::spawn(const std::string& id,
                                const std::string& command,
                                TempFile workload,
                                TempFile config,
                                PortSet ports,
                                const JobResources& resources) {
    workload.close();
    config.close();

    // Build argv before fork; the child must not allocate
    std::vector<std::string> args = {
        command, "run", "--wasmcfgfile", config.path(), workload.path()
    };
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdout_pipe[2], stderr_pipe[2], status_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        throw SpawnError(std::string("pipe: ") + std::strerror(errno));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        throw SpawnError(std::string("pipe: ") + std::strerror(err));
    }
    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) ::close(fd);
        throw SpawnError(std::string("pipe: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1],
                       status_pipe[0], status_pipe[1]}) {
            ::close(fd);
        }
        throw SpawnError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process: own process group so kill() reaches descendants
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail(status_pipe[1], errno);
        if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0) child_fail(status_pipe[1], errno);
        if (dup2(stderr_pipe[1], STDERR_FILENO) < 0) child_fail(status_pipe[1], errno);

        if (resources.sandbox) {
            int err = resources.sandbox->enter();
            if (err != 0) child_fail(status_pipe[1], err);
        }

        execvp(argv[0], argv.data());
        child_fail(status_pipe[1], errno);
    }

    // Parent process
    setpgid(pid, pid);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);

    // The status pipe closes on successful exec; otherwise it carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n != 0) {
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        std::string reason = n == static_cast<ssize_t>(sizeof(child_errno))
            ? std::strerror(child_errno)
            : "lost exec status";
        throw SpawnError(command + ": " + reason);
    }

    fcntl(stdout_pipe[0], F_SETFL, fcntl(stdout_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, fcntl(stderr_pipe[0], F_GETFL) | O_NONBLOCK);

    return std::unique_ptr<Job>(new Job(id, pid, stdout_pipe[0], stderr_pipe[0],
                                        std::move(workload), std::move(config),
                                        std::move(ports), resources));
}

Job::Job(std::string id, pid_t pid, int stdout_fd, int stderr_fd,
         TempFile workload, TempFile config, PortSet ports, const JobResources& resources)
    : id_(std::move(id)), pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
      workload_(std::move(workload)), config_(std::move(config)), ports_(std::move(ports)),
      resources_(resources) {}

Job::~Job() {
    kill(JobState::KILLED);
}

size_t Job::read(Stream stream, char* buffer, size_t capacity, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    int& fd = stream == Stream::OUTPUT ? stdout_fd_ : stderr_fd_;
    if (fd < 0 || capacity == 0) {
        return 0;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int rc;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        rc = poll(&pfd, 1, static_cast<int>(std::max<long long>(0, remaining.count())));
        if (rc < 0 && errno == EINTR) continue;
        break;
    }

    if (rc < 0) {
        throw ReadError(std::string("poll: ") + std::strerror(errno));
    }
    if (rc == 0) {
        return 0;  // Deadline elapsed, nothing new
    }
    if (pfd.revents & POLLNVAL) {
        throw ReadError("invalid descriptor");
    }

    ssize_t n;
    do {
        n = ::read(fd, buffer, capacity);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
        throw ReadError(std::strerror(errno));
    }
    if (n == 0) {
        close_fd(fd);  // End of stream
    }
    return static_cast<size_t>(n);
}

bool Job::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stdout_fd_ < 0 && stderr_fd_ < 0;
}

bool Job::poll_exit_locked() {
    if (exited_ || waited_) return true;

    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
        if (info.si_pid == pid_) {
            exited_ = true;
            exit_code_ = info.si_code == CLD_EXITED ? info.si_status : -info.si_status;
            if (termination_ == JobState::RUNNING) {
                termination_ = JobState::EXITED;
            }
        }
    } else if (errno == ECHILD) {
        waited_ = true;  // Collected elsewhere
    }
    return exited_ || waited_;
}

void Job::wait_locked() {
    if (waited_) return;

    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);

    waited_ = true;
    if (rc == pid_ && !exited_) {
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);
    }
}

void Job::close_streams_locked() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

bool Job::has_exited() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return true;
    return poll_exit_locked();
}

void Job::kill(JobState reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return;

    bool running = !poll_exit_locked();
    if (running && termination_ == JobState::RUNNING) {
        termination_ = reason;
    }

    // The leader is collected only below, so the group id cannot have been
    // reused yet. This also reaches descendants of a leader that already exited.
    if (!waited_) {
        ::kill(-pid_, SIGKILL);
    }
    wait_locked();
    close_streams_locked();

    if (resources_.ports) {
        resources_.ports->release(ports_);
    }
    if (resources_.counter) {
        resources_.counter->release();
    }
    reaped_ = true;

    std::cout << "[jobs] job reaped. job_id=" << id_
              << ", reason=" << job_state_to_string(termination_)
              << ", exit=" << exit_code_ << std::endl;
}

JobState Job::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_ ? JobState::REAPED : termination_;
}

JobState Job::termination() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return termination_;
}

int Job::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

} // namespace benefice
