#include "peer/internal/interrupts.hpp"
#include "server/peerListener.hpp"
#include "storage/memoryFileStore.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <pthread.h>
#include <set>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>

using namespace p2ps;

namespace {

volatile sig_atomic_t interrupted = 0;

void markInterrupted(int) {
    interrupted = 1;
}

bool sigintBlockedHere() {
    sigset_t current;
    sigemptyset(&current);
    pthread_sigmask(SIG_BLOCK, nullptr, &current);
    return sigismember(&current, SIGINT) == 1;
}

//SigBlk of one of this process's threads, from /proc
bool sigintBlockedIn(const std::filesystem::path& task_dir) {
    std::ifstream status(task_dir / "status");
    std::string   line;
    while (std::getline(status, line)) {
        if (line.rfind("SigBlk:", 0) != 0)
            continue;
        unsigned long long mask = std::stoull(line.substr(7), nullptr, 16);
        return (mask >> (SIGINT - 1)) & 1;
    }
    return false;
}

std::filesystem::path taskDir(const std::string& tid) {
    return std::filesystem::path("/proc/self/task") / tid;
}

std::set<std::string> taskIds() {
    std::set<std::string> ids;
    for (const auto& task : std::filesystem::directory_iterator("/proc/self/task"))
        ids.insert(task.path().filename().string());
    return ids;
}

class InterruptsTest : public ::testing::Test {
protected:
    sigset_t         saved_mask;
    struct sigaction saved_action {};

    void SetUp() override {
        interrupted = 0;
        pthread_sigmask(SIG_BLOCK, nullptr, &saved_mask);
        sigaction(SIGINT, nullptr, &saved_action);
    }

    void TearDown() override {
        sigaction(SIGINT, &saved_action, nullptr);
        pthread_sigmask(SIG_SETMASK, &saved_mask, nullptr);
    }
};

} //namespace

TEST_F(InterruptsTest, ThreadsStartedAfterBlockingInheritTheMask) {
    ASSERT_EQ(blockInterrupts(), EXIT_SUCCESS);
    EXPECT_TRUE(sigintBlockedHere());

    std::atomic<bool> worker_blocked = false;
    std::thread worker([&] { worker_blocked = sigintBlockedHere(); });
    worker.join();
    EXPECT_TRUE(worker_blocked);
}

TEST_F(InterruptsTest, HandlerRunsOnlyInCatchingThread) {
    ASSERT_EQ(blockInterrupts(), EXIT_SUCCESS);

    std::atomic<bool> worker_blocked = false;
    std::thread worker([&] { worker_blocked = sigintBlockedHere(); });

    ASSERT_EQ(catchInterrupts(markInterrupted), EXIT_SUCCESS);
    EXPECT_FALSE(sigintBlockedHere());
    worker.join();
    EXPECT_TRUE(worker_blocked);

    //raise() signals the calling thread
    raise(SIGINT);
    EXPECT_EQ(interrupted, 1);
}

TEST_F(InterruptsTest, ListenerThreadsLeaveSigintToMenuThread) {
    MemoryFileStore shared;
    std::set<std::string> before = taskIds();

    ASSERT_EQ(blockInterrupts(), EXIT_SUCCESS);
    {
        PeerListener listener(shared);
        ASSERT_EQ(listener.start(0), ErrorCode::OK);
        ASSERT_EQ(catchInterrupts(markInterrupted), EXIT_SUCCESS);

        EXPECT_FALSE(sigintBlockedIn(taskDir(std::to_string(getpid()))));

        size_t workers = 0;
        for (const std::string& tid : taskIds()) {
            if (before.count(tid))
                continue;
            ++workers;
            EXPECT_TRUE(sigintBlockedIn(taskDir(tid))) << "thread " << tid;
        }
        EXPECT_GE(workers, 1u);
    }
}
