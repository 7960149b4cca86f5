#include <signal.h>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/process.hpp"

using namespace std;
using namespace bubble;

static process_options shell(const string &script) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", script};
    opt.stream_limit = 1024;
    return opt;
}

TEST(ProcessTest, CapturesStdoutAndStderr) {
    process_result result = run_process(shell("echo hello; echo oops >&2; exit 3"));
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(result.signal, -1);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "oops\n");
    EXPECT_FALSE(result.stdout_truncated);
    EXPECT_FALSE(result.watchdog_fired);
}

TEST(ProcessTest, FeedsStdin) {
    process_options opt = shell("read a b; echo $((a + b))");
    opt.stdin_payload = "1 2\n";
    process_result result = run_process(opt);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data, "3\n");
}

TEST(ProcessTest, IgnoresUnreadStdin) {
    process_options opt = shell("exit 0");
    opt.stdin_payload = string(1 << 20, 'x');
    process_result result = run_process(opt);
    EXPECT_EQ(result.exitcode, 0);
}

TEST(ProcessTest, TruncatesOutputButCountsIt) {
    process_options opt = shell("head -c 5000 /dev/zero");
    process_result result = run_process(opt);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data.size(), 1024u);
    EXPECT_EQ(result.stdout_bytes, 5000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(ProcessTest, OutputAtLimitIsNotTruncated) {
    process_result result = run_process(shell("head -c 1024 /dev/zero"));
    EXPECT_EQ(result.stdout_data.size(), 1024u);
    EXPECT_FALSE(result.stdout_truncated);
}

TEST(ProcessTest, ReportsTerminatingSignal) {
    process_result result = run_process(shell("kill -SEGV $$"));
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exitcode, 128 + SIGSEGV);
}

TEST(ProcessTest, WatchdogKillsProcessGroup) {
    process_options opt = shell("sleep 30 & sleep 30; wait");
    opt.watchdog = 0.3;
    process_result result = run_process(opt);
    EXPECT_TRUE(result.watchdog_fired);
    EXPECT_NE(result.exitcode, 0);
    EXPECT_LT(result.wall_time, 5);
}

TEST(ProcessTest, DetachedDescendantsDoNotBlock) {
    process_result result = run_process(shell("sleep 30 & echo started"));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data, "started\n");
    EXPECT_LT(result.wall_time, 5);
}

TEST(ProcessTest, MissingExecutableThrows) {
    process_options opt;
    opt.command = {"/definitely/not/an/executable"};
    EXPECT_THROW(run_process(opt), sandbox_error);
}

TEST(ProcessTest, EmptyCommandThrows) {
    EXPECT_THROW(run_process(process_options()), sandbox_error);
}
