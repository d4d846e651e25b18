#include <gtest/gtest.h>
#include "job.h"
#include "../test_support.h"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <fstream>
#include <cerrno>
#include <signal.h>

namespace benefice {
namespace {

using test_support::ScratchDir;
using test_support::stage;

// Running (not a zombie and not gone), per /proc
bool process_running(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return false;
    size_t paren = line.rfind(')');
    return paren != std::string::npos && paren + 2 < line.size() && line[paren + 2] != 'Z';
}

class JobTest : public ::testing::Test {
protected:
    std::unique_ptr<Job> spawn(const std::string& script, PortSet ports = {}) {
        std::string runner = bin.runner("runner-" + std::to_string(++runners) + ".sh", script);
        if (!ports.empty()) {
            EXPECT_TRUE(registry.try_reserve(ports, "job-under-test").empty());
        }
        EXPECT_TRUE(counter.try_acquire(100));
        StagedUpload upload = stage(staging.path(), "wasm-bytes", "[[files]]\nkind = \"stdin\"\n");
        return Job::spawn("job-under-test", runner, std::move(upload.workload),
                          std::move(upload.config), ports, resources());
    }

    JobResources resources() {
        JobResources res;
        res.ports = &registry;
        res.counter = &counter;
        return res;
    }

    // Read until `needle` shows up or a few seconds pass
    std::string read_until(Job& job, Stream stream, const std::string& needle) {
        std::string collected;
        char buffer[OUTPUT_READ_SIZE];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (collected.find(needle) == std::string::npos &&
               std::chrono::steady_clock::now() < deadline) {
            size_t n = job.read(stream, buffer, sizeof(buffer), std::chrono::milliseconds(100));
            collected.append(buffer, n);
        }
        return collected;
    }

    bool wait_for_exit(Job& job) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!job.has_exited()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return true;
    }

    ScratchDir bin;
    ScratchDir staging;
    PortRegistry registry;
    JobCounter counter;
    int runners = 0;
};

TEST_F(JobTest, RunnerReceivesConfigAndWorkload) {
    auto job = spawn("echo \"$1 $2\"; test -f \"$3\" && test -f \"$4\" && echo staged; exec sleep 30");

    std::string out = read_until(*job, Stream::OUTPUT, "staged");
    EXPECT_NE(out.find("run --wasmcfgfile"), std::string::npos) << out;
    EXPECT_NE(out.find("staged"), std::string::npos) << out;
    EXPECT_EQ(job->state(), JobState::RUNNING);
    EXPECT_GT(job->pid(), 0);
}

TEST_F(JobTest, ReadsStdoutAndStderrSeparately) {
    auto job = spawn("echo to-stdout; echo to-stderr >&2; exec sleep 30");

    std::string out = read_until(*job, Stream::OUTPUT, "to-stdout");
    std::string err = read_until(*job, Stream::ERROR, "to-stderr");
    EXPECT_EQ(out, "to-stdout\n");
    EXPECT_EQ(err, "to-stderr\n");
}

TEST_F(JobTest, EmptyReadReturnsZeroWithinDeadline) {
    // Given: a job that never writes
    auto job = spawn("exec sleep 30");
    char buffer[OUTPUT_READ_SIZE];

    // When: reading with the default deadline
    auto start = std::chrono::steady_clock::now();
    size_t n = job->read(Stream::OUTPUT, buffer, sizeof(buffer));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: zero bytes, not an error, after roughly the deadline
    EXPECT_EQ(n, 0u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(READ_TIMEOUT_MS + 1000));
    EXPECT_GE(elapsed, std::chrono::milliseconds(READ_TIMEOUT_MS - 50));
}

TEST_F(JobTest, ReadRespectsCapacity) {
    auto job = spawn("printf 'abcdefghij'; exec sleep 30");

    char buffer[4];
    std::string collected;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (collected.size() < 10 && std::chrono::steady_clock::now() < deadline) {
        size_t n = job->read(Stream::OUTPUT, buffer, sizeof(buffer), std::chrono::milliseconds(100));
        EXPECT_LE(n, sizeof(buffer));
        collected.append(buffer, n);
    }
    EXPECT_EQ(collected, "abcdefghij");
}

TEST_F(JobTest, NaturalExitIsDetected) {
    auto job = spawn("echo done; exit 3");

    std::string out = read_until(*job, Stream::OUTPUT, "done");
    EXPECT_EQ(out, "done\n");
    ASSERT_TRUE(wait_for_exit(*job));

    job->kill(JobState::EXITED);
    EXPECT_EQ(job->termination(), JobState::EXITED);
    EXPECT_EQ(job->state(), JobState::REAPED);
    EXPECT_EQ(job->exit_code(), 3);
    EXPECT_EQ(counter.count(), 0u);
}

TEST_F(JobTest, ReadAfterExitDrainsThenReturnsZero) {
    auto job = spawn("echo last words");
    ASSERT_TRUE(wait_for_exit(*job));

    char buffer[OUTPUT_READ_SIZE];
    size_t n = job->read(Stream::OUTPUT, buffer, sizeof(buffer));
    EXPECT_EQ(std::string(buffer, n), "last words\n");

    // End of stream, then nothing more
    EXPECT_EQ(job->read(Stream::OUTPUT, buffer, sizeof(buffer)), 0u);
    EXPECT_EQ(job->read(Stream::OUTPUT, buffer, sizeof(buffer)), 0u);
}

TEST_F(JobTest, KillIsIdempotentAndReleasesOnce) {
    // Given: a running job holding two ports and one counter slot
    auto job = spawn("exec sleep 30", {5000, 5001});
    ASSERT_EQ(registry.size(), 2u);
    ASSERT_EQ(counter.count(), 1u);

    // When: killed repeatedly
    job->kill();
    job->kill();
    job->kill(JobState::TIMED_OUT);

    // Then: resources were released exactly once
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(counter.count(), 0u);
    EXPECT_EQ(job->termination(), JobState::KILLED);
    EXPECT_EQ(job->state(), JobState::REAPED);
    EXPECT_TRUE(job->has_exited());
}

TEST_F(JobTest, KillAfterExitStillReleases) {
    auto job = spawn("exit 0", {6000});
    ASSERT_TRUE(wait_for_exit(*job));
    EXPECT_TRUE(registry.is_held(6000));

    job->kill();
    EXPECT_FALSE(registry.is_held(6000));
    EXPECT_EQ(counter.count(), 0u);
    EXPECT_EQ(job->termination(), JobState::EXITED);
}

TEST_F(JobTest, ExitedLeaderHeldUntilKill) {
    // Given: a job that exited on its own
    auto job = spawn("exit 0");
    ASSERT_TRUE(wait_for_exit(*job));
    pid_t pid = job->pid();

    // Then: the leader is not collected yet, so its pid still names the group
    EXPECT_EQ(::kill(pid, 0), 0);
    EXPECT_FALSE(process_running(pid));

    // And: kill collects it
    job->kill();
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(JobTest, KillAfterLeaderExitReachesDescendants) {
    // Given: a leader that leaves a background child behind and exits
    auto job = spawn("sleep 30 & echo $!; exit 0");
    std::string out = read_until(*job, Stream::OUTPUT, "\n");
    pid_t child = static_cast<pid_t>(std::stoi(out));
    ASSERT_TRUE(wait_for_exit(*job));
    ASSERT_TRUE(process_running(child));

    // When: the job is killed
    job->kill();

    // Then: the background child is gone too
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (process_running(child) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_FALSE(process_running(child));
}

TEST_F(JobTest, KillDoesNotReleasePortsTakenOverByAnotherJob) {
    auto job = spawn("exec sleep 30", {7000});
    job->kill();
    ASSERT_TRUE(registry.try_reserve({7000}, "newer-job").empty());

    job->kill();
    EXPECT_EQ(registry.owner_of(7000), "newer-job");
}

TEST_F(JobTest, KillWithTimeoutReasonIsRecorded) {
    auto job = spawn("exec sleep 30");
    job->kill(JobState::TIMED_OUT);
    EXPECT_EQ(job->termination(), JobState::TIMED_OUT);
}

TEST_F(JobTest, DestructionReleasesResources) {
    {
        auto job = spawn("exec sleep 30", {8000});
        EXPECT_EQ(counter.count(), 1u);
    }
    EXPECT_EQ(counter.count(), 0u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(JobTest, StagedArtifactsRemovedWithJob) {
    auto job = spawn("exec sleep 30");
    EXPECT_EQ(staging.entries(), 2u);
    job.reset();
    EXPECT_EQ(staging.entries(), 0u);
}

TEST_F(JobTest, MissingBinaryIsSpawnError) {
    StagedUpload upload = stage(staging.path(), "wasm-bytes", "");
    EXPECT_THROW(Job::spawn("job-x", bin.path() + "/no-such-runner", std::move(upload.workload),
                            std::move(upload.config), {}, resources()),
                 SpawnError);

    // Nothing was taken over; staged files are gone
    EXPECT_EQ(counter.count(), 0u);
    EXPECT_EQ(staging.entries(), 0u);
}

TEST_F(JobTest, NonExecutableRunnerIsSpawnError) {
    std::string plain = bin.write("not-executable.sh", "#!/bin/sh\necho hi\n");
    StagedUpload upload = stage(staging.path(), "wasm-bytes", "");
    try {
        Job::spawn("job-x", plain, std::move(upload.workload), std::move(upload.config), {}, resources());
        FAIL() << "Expected SpawnError";
    } catch (const SpawnError& e) {
        EXPECT_NE(std::string(e.what()).find("Permission denied"), std::string::npos) << e.what();
    }
}

TEST(JobStateTest, Names) {
    EXPECT_EQ(job_state_to_string(JobState::RUNNING), "running");
    EXPECT_EQ(job_state_to_string(JobState::KILLED), "killed");
    EXPECT_EQ(job_state_to_string(JobState::TIMED_OUT), "timed_out");
    EXPECT_EQ(job_state_to_string(JobState::EXITED), "exited");
    EXPECT_EQ(job_state_to_string(JobState::REAPED), "reaped");
}

// ============================================================================
// Live job counter
// ============================================================================

TEST(JobCounterTest, AcquireUpToLimit) {
    JobCounter counter;
    EXPECT_TRUE(counter.try_acquire(2));
    EXPECT_TRUE(counter.try_acquire(2));
    EXPECT_FALSE(counter.try_acquire(2));
    EXPECT_EQ(counter.count(), 2u);

    counter.release();
    EXPECT_TRUE(counter.try_acquire(2));
}

TEST(JobCounterTest, ZeroLimitAdmitsNothing) {
    JobCounter counter;
    EXPECT_FALSE(counter.try_acquire(0));
    EXPECT_EQ(counter.count(), 0u);
}

TEST(JobCounterTest, ConcurrentAcquireNeverExceedsLimit) {
    JobCounter counter;
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 32; ++i) {
        threads.emplace_back([&counter, &granted]() {
            for (int j = 0; j < 100; ++j) {
                if (counter.try_acquire(5)) ++granted;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.load(), 5);
    EXPECT_EQ(counter.count(), 5u);
}

} // namespace
} // namespace benefice
