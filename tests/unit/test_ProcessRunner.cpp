#include <gtest/gtest.h>
#include "process/ProcessRunner.hpp"

#include <chrono>

using namespace ms::process;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    PosixProcessRunner runner;
};

TEST_F(ProcessRunnerTest, CapturesStdout) {
    const auto r = runner.run({"/bin/sh", "-c", "printf hello"}, 5s, 1024);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out, "hello");
}

TEST_F(ProcessRunnerTest, DiscardsStderr) {
    const auto r = runner.run({"/bin/sh", "-c", "echo noise 1>&2; printf out"}, 5s, 1024);
    EXPECT_EQ(r.out, "out");
}

TEST_F(ProcessRunnerTest, ReportsNonZeroExit) {
    const auto r = runner.run({"/bin/sh", "-c", "exit 3"}, 5s, 1024);
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 3);
}

TEST_F(ProcessRunnerTest, MissingExecutableExits127) {
    const auto r = runner.run({"/nonexistent/mediascope-no-such-binary"}, 5s, 1024);
    EXPECT_EQ(r.exit_code, 127);
}

TEST_F(ProcessRunnerTest, KillsOnTimeout) {
    const auto start = std::chrono::steady_clock::now();
    const auto r = runner.run({"/bin/sh", "-c", "sleep 10"}, 300ms, 1024);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.ok());
    EXPECT_LT(elapsed, 5s);
}

TEST_F(ProcessRunnerTest, StopsAtOutputCap) {
    const auto r = runner.run({"/bin/sh", "-c", "yes mediascope"}, 5s, 4096);
    EXPECT_TRUE(r.output_truncated);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.out.size(), 4096u);
}

TEST_F(ProcessRunnerTest, RejectsEmptyCommandLine) {
    EXPECT_THROW(runner.run({}, 1s, 16), std::invalid_argument);
}
