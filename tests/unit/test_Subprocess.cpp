#include <gtest/gtest.h>
#include "util/Subprocess.hpp"

#include <thread>

using namespace ss::util;
using namespace std::chrono_literals;

class SubprocessTest : public ::testing::Test {};

TEST_F(SubprocessTest, CapturesStdoutAndExitCode) {
    const auto res = Subprocess::run({"/bin/sh", "-c", "echo hello; exit 3"});
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.stdout_text, "hello\n");
    EXPECT_FALSE(res.ok());
    EXPECT_FALSE(res.spawn_error.has_value());
}

TEST_F(SubprocessTest, CapturesStderrSeparately) {
    const auto res = Subprocess::run({"/bin/sh", "-c", "echo out; echo oops >&2"});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.stdout_text, "out\n");
    EXPECT_EQ(res.stderr_text, "oops\n");
}

TEST_F(SubprocessTest, LargeOutputDoesNotDeadlock) {
    const auto res = Subprocess::run({"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line-$i; i=$((i+1)); done"});
    EXPECT_TRUE(res.ok());
    EXPECT_GT(res.stdout_text.size(), 100000u);
}

TEST_F(SubprocessTest, TimeoutKillsChild) {
    ProcessOptions opts;
    opts.timeout = 200ms;
    opts.grace = 100ms;

    const auto start = std::chrono::steady_clock::now();
    const auto res = Subprocess::run({"/bin/sh", "-c", "sleep 10"}, opts);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(res.timed_out);
    EXPECT_FALSE(res.ok());
    EXPECT_LT(elapsed, 5s);
}

TEST_F(SubprocessTest, CancelFlagStopsChild) {
    ProcessOptions opts;
    opts.grace = 100ms;
    opts.cancel = std::make_shared<std::atomic<bool>>(false);

    std::thread canceller([flag = opts.cancel] {
        std::this_thread::sleep_for(150ms);
        flag->store(true);
    });

    const auto res = Subprocess::run({"/bin/sh", "-c", "sleep 10"}, opts);
    canceller.join();

    EXPECT_TRUE(res.cancelled);
    EXPECT_FALSE(res.timed_out);
}

TEST_F(SubprocessTest, MissingBinaryReportsSpawnError) {
    const auto res = Subprocess::run({"stitch-sync-definitely-not-a-real-binary"});
    ASSERT_TRUE(res.spawn_error.has_value());
    EXPECT_EQ(res.exit_code, 127);
    EXPECT_NE(res.spawn_error->find("stitch-sync-definitely-not-a-real-binary"), std::string::npos);
}

TEST_F(SubprocessTest, EmptyArgvIsRejected) {
    const auto res = Subprocess::run({});
    EXPECT_TRUE(res.spawn_error.has_value());
}

TEST_F(SubprocessTest, WhichFindsShell) {
    const auto sh = Subprocess::which("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->front(), '/');
    EXPECT_FALSE(Subprocess::which("stitch-sync-definitely-not-a-real-binary").has_value());
}
