#include <signal.h>
#include "gtest/gtest.h"
#include "executor/classifier.hpp"

using namespace std;
using namespace bubble;

class ClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits.time_limit = 1;
        limits.overall_time_limit = 10;
        limits.memory_limit = 65536;
        limits.max_input_size = 1;
        limits.max_output_size = 1;

        time_result usage;
        usage.elapsed_time = 0.2;
        usage.max_resident_set_size = 4096;
        in.usage = usage;
        in.elapsed = 0.2;
        in.input_size = 10;
    }

    resource_limits limits;
    classify_input in;
};

TEST_F(ClassifierTest, Success) {
    EXPECT_EQ(classify(in, limits), execution_status::SUCCESS);
    EXPECT_FALSE(explain(execution_status::SUCCESS, in, limits));
}

TEST_F(ClassifierTest, OversizedInputComesFirst) {
    in.input_size = 1025;
    in.compile_failed = true;
    in.guard_killed = true;
    EXPECT_EQ(classify(in, limits), execution_status::INPUT_LIMIT_EXCEEDED);

    in.input_size = 1024;
    EXPECT_EQ(classify(in, limits), execution_status::COMPILE_ERROR);
}

TEST_F(ClassifierTest, CompileFailureBeatsRunFindings) {
    in.compile_failed = true;
    in.return_code = 1;
    EXPECT_EQ(classify(in, limits), execution_status::COMPILE_ERROR);
}

TEST_F(ClassifierTest, TimeLimitOverridesZeroReturnCode) {
    in.elapsed = 1.0;
    EXPECT_EQ(classify(in, limits), execution_status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(*explain(execution_status::TIME_LIMIT_EXCEEDED, in, limits),
              "Time limit exceeded. Execution time: 1.000 seconds.");
}

TEST_F(ClassifierTest, GuardKillIsTimeLimit) {
    in.guard_killed = true;
    in.return_code = 124;
    in.usage.reset();
    EXPECT_EQ(classify(in, limits), execution_status::TIME_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, TimeWinsOverMemory) {
    in.elapsed = 1.5;
    in.usage->max_resident_set_size = 65536;
    EXPECT_EQ(classify(in, limits), execution_status::TIME_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, OverallBudgetCrossedByThisRun) {
    in.cumulative_elapsed = 9.5;
    in.elapsed = 0.5;
    EXPECT_EQ(classify(in, limits), execution_status::OVERALL_TIME_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, BudgetCappedGuardKillIsOverallLimit) {
    in.cumulative_elapsed = 9.7;
    in.elapsed = 0.25;
    in.guard_killed = true;
    in.budget_capped = true;
    in.return_code = 124;
    EXPECT_EQ(classify(in, limits), execution_status::OVERALL_TIME_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, PeakMemoryOverridesZeroReturnCode) {
    in.usage->max_resident_set_size = 65536;
    EXPECT_EQ(classify(in, limits), execution_status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(*explain(execution_status::MEMORY_LIMIT_EXCEEDED, in, limits),
              "Memory limit exceeded. Peak memory: 65536 KB.");
}

TEST_F(ClassifierTest, AllocationFailureIsMemoryLimit) {
    in.return_code = 1;
    in.stderr_data = "Traceback (most recent call last):\nMemoryError\n";
    EXPECT_EQ(classify(in, limits), execution_status::MEMORY_LIMIT_EXCEEDED);

    in.return_code = 128 + SIGABRT;
    in.stderr_data = "terminate called after throwing an instance of 'std::bad_alloc'\n";
    EXPECT_EQ(classify(in, limits), execution_status::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, SigkillWithoutGuardIsMemoryLimit) {
    in.return_code = 128 + SIGKILL;
    EXPECT_EQ(classify(in, limits), execution_status::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, AllocationMessageOfSuccessfulRunIsIgnored) {
    in.stdout_truncated = false;
    in.stderr_data = "caught MemoryError, retrying with less\n";
    EXPECT_EQ(classify(in, limits), execution_status::SUCCESS);
}

TEST_F(ClassifierTest, TruncatedOutputOverridesZeroReturnCode) {
    in.stdout_truncated = true;
    EXPECT_EQ(classify(in, limits), execution_status::OUTPUT_LIMIT_EXCEEDED);

    in.stdout_truncated = false;
    in.stderr_truncated = true;
    EXPECT_EQ(classify(in, limits), execution_status::OUTPUT_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, FileSizeSignalIsOutputLimit) {
    in.return_code = 128 + SIGXFSZ;
    EXPECT_EQ(classify(in, limits), execution_status::OUTPUT_LIMIT_EXCEEDED);
}

TEST_F(ClassifierTest, NonZeroReturnCodeIsRuntimeError) {
    in.return_code = 3;
    EXPECT_EQ(classify(in, limits), execution_status::RUNTIME_ERROR);
    EXPECT_EQ(*explain(execution_status::RUNTIME_ERROR, in, limits), "Runtime error. Return code: 3.");

    in.return_code = 128 + SIGSEGV;
    EXPECT_EQ(classify(in, limits), execution_status::RUNTIME_ERROR);
    EXPECT_EQ(termination_signal(in.return_code).value_or(-1), SIGSEGV);
}

TEST_F(ClassifierTest, MeasuredRunUnderGenerousLimitsSucceeds) {
    const string record = "Command: ./main\n"
                          "Elapsed time: 0:01.52\n"
                          "User CPU time: 1.40\n"
                          "System CPU time: 0.08\n"
                          "CPU Percentage: 97%\n"
                          "Avg total memory usage: 0 KB\n"
                          "Avg shared memory size: 0 KB\n"
                          "Avg unshared data size: 0 KB\n"
                          "Avg unshared stack size: 0 KB\n"
                          "Page reclaims (soft page faults): 1832\n"
                          "Page faults (hard page faults): 3\n"
                          "Swaps: 0\n"
                          "Block input operations: 16\n"
                          "Block output operations: 8\n"
                          "IPC messages sent: 0\n"
                          "IPC messages received: 0\n"
                          "Signals received: 0\n"
                          "Voluntary context switches: 12\n"
                          "Involuntary context switches: 40\n"
                          "Maximum resident set size: 9876 KB\n"
                          "Exit status: 0\n";

    resource_limits generous;
    generous.time_limit = 1000;
    generous.overall_time_limit = 1000;
    generous.memory_limit = 1 << 30;
    generous.max_input_size = 1 << 20;
    generous.max_output_size = 1 << 20;

    for (const string &preamble : {"", "Command terminated by signal 9\n", "Command exited with non-zero status 1\n"}) {
        auto usage = parse_time_result(preamble + record);
        ASSERT_TRUE(usage) << preamble;

        classify_input measured;
        measured.input_size = 10;
        measured.usage = usage;
        measured.elapsed = usage->elapsed_time;
        EXPECT_EQ(classify(measured, generous), execution_status::SUCCESS) << preamble;
    }
}

TEST(ExecutionStatusTest, NamesRoundTrip) {
    EXPECT_STREQ(status_name(execution_status::OVERALL_TIME_LIMIT_EXCEEDED), "OVERALL_TIME_LIMIT_EXCEEDED");
    EXPECT_STREQ(get_display_message(execution_status::MEMORY_LIMIT_EXCEEDED), "Memory Limit Exceeded");
    EXPECT_EQ(status_from_string("INTERNAL_ERROR"), execution_status::INTERNAL_ERROR);
}
