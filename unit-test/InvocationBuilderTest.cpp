#include <algorithm>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/time_result.hpp"
#include "sandbox/wrapper.hpp"

using namespace std;
using namespace bubble;
using ::testing::ElementsAre;

static bool contains_sequence(const vector<string> &argv, const vector<string> &seq) {
    return search(argv.begin(), argv.end(), seq.begin(), seq.end()) != argv.end();
}

TEST(InvocationBuilderTest, TimeWrapper) {
    time_wrapper wrapper("/usr/bin/time", "/app/time_output.txt");
    EXPECT_THAT(wrapper.wrap({"./main"}),
                ElementsAre("/usr/bin/time", "-f", TIME_FORMAT, "-o", "/app/time_output.txt", "./main"));
}

TEST(InvocationBuilderTest, TimeoutWrapperSignalsWholeGroup) {
    timeout_wrapper wrapper("timeout", 1.5, 1);
    vector<string> argv = wrapper.wrap({"./main"});
    EXPECT_THAT(argv, ElementsAre("timeout", "--kill-after=1.000s", "1.500s", "./main"));
    EXPECT_EQ(find(argv.begin(), argv.end(), "--foreground"), argv.end());
}

TEST(InvocationBuilderTest, PrlimitWrapperUsesBytes) {
    prlimit_wrapper wrapper("prlimit", 65536, 2252);
    EXPECT_THAT(wrapper.wrap({"./main", "arg"}),
                ElementsAre("prlimit", "--as=67108864", "--fsize=2306048", "--", "./main", "arg"));
}

TEST(InvocationBuilderTest, BwrapWrapperIsolatesEverything) {
    sandbox_config config;
    config.bind_mounts = {{"/", "/host"}, {"/definitely/not/here", "/nowhere"}};
    config.tmpfs_paths = {"/tmp"};
    config.env_vars = {{"PATH", "/usr/bin:/bin"}, {"LANG", "C.UTF-8"}};
    config.hostname = "box";

    bwrap_wrapper wrapper(config, "/srv/workspace/run", {{"/srv/workspace/program", "/program"}});
    vector<string> argv = wrapper.wrap({"/program/main"});

    ASSERT_GE(argv.size(), 5u);
    EXPECT_THAT(vector<string>(argv.begin(), argv.begin() + 4),
                ElementsAre("bwrap", "--unshare-all", "--die-with-parent", "--new-session"));
    EXPECT_TRUE(contains_sequence(argv, {"--ro-bind", "/", "/host"}));
    EXPECT_FALSE(contains_sequence(argv, {"--ro-bind", "/definitely/not/here", "/nowhere"}));
    EXPECT_TRUE(contains_sequence(argv, {"--bind", "/srv/workspace/run", "/app", "--chdir", "/app"}));
    EXPECT_TRUE(contains_sequence(argv, {"--ro-bind", "/srv/workspace/program", "/program"}));
    EXPECT_TRUE(contains_sequence(argv, {"--tmpfs", "/tmp"}));
    EXPECT_TRUE(contains_sequence(argv, {"--proc", "/proc"}));
    EXPECT_TRUE(contains_sequence(argv, {"--dev", "/dev"}));
    EXPECT_TRUE(contains_sequence(argv, {"--hostname", "box", "--clearenv"}));
    EXPECT_TRUE(contains_sequence(argv, {"--setenv", "LANG", "C.UTF-8"}));
    EXPECT_TRUE(contains_sequence(argv, {"--setenv", "PATH", "/usr/bin:/bin"}));
    EXPECT_TRUE(contains_sequence(argv, {"--", "/program/main"}));
    EXPECT_EQ(argv.back(), "/program/main");
}

TEST(InvocationBuilderTest, BwrapWrapperOptionalFilesystems) {
    sandbox_config config;
    config.use_proc = false;
    config.use_dev = false;
    bwrap_wrapper wrapper(config, "/srv/workspace/run", {});
    vector<string> argv = wrapper.wrap({"true"});
    EXPECT_EQ(find(argv.begin(), argv.end(), "--proc"), argv.end());
    EXPECT_EQ(find(argv.begin(), argv.end(), "--dev"), argv.end());
}

TEST(InvocationBuilderTest, LayersFromInsideOut) {
    sandbox_config config;
    config.bind_mounts.clear();
    invocation_builder builder;
    builder.then(make_unique<time_wrapper>("/usr/bin/time", "/app/time_output.txt"))
        .then(make_unique<timeout_wrapper>("timeout", 2, 1))
        .then(make_unique<prlimit_wrapper>("prlimit", 1024, 10))
        .then(make_unique<bwrap_wrapper>(config, "/srv/run", vector<bind_mount>{}));
    vector<string> argv = builder.build({"./main"});

    auto position = [&](const string &arg) { return find(argv.begin(), argv.end(), arg) - argv.begin(); };
    EXPECT_EQ(argv.front(), "bwrap");
    EXPECT_LT(position("prlimit"), position("timeout"));
    EXPECT_LT(position("timeout"), position("/usr/bin/time"));
    EXPECT_LT(position("/usr/bin/time"), position("./main"));
    EXPECT_EQ(argv.back(), "./main");
}

TEST(InvocationBuilderTest, FindsWrapperDiagnostics) {
    sandbox_config config;
    config.bwrap_path = "/usr/local/bin/bwrap";
    invocation_builder builder;
    builder.then(make_unique<time_wrapper>("/usr/bin/time", "/app/time_output.txt"))
        .then(make_unique<bwrap_wrapper>(config, "/srv/run", vector<bind_mount>{}));

    EXPECT_EQ(builder.find_diagnostic(1, "bwrap: No permissions to creating new namespace\n").value_or(""),
              "bwrap: No permissions to creating new namespace");
    EXPECT_EQ(builder.find_diagnostic(127, "/usr/bin/time: cannot run ./main: No such file or directory\n").value_or(""),
              "/usr/bin/time: cannot run ./main: No such file or directory");
    EXPECT_FALSE(builder.find_diagnostic(1, "Traceback (most recent call last):\nValueError: bad\n"));
    EXPECT_FALSE(builder.find_diagnostic(1, ""));
}

TEST(InvocationBuilderTest, IgnoresDiagnosticsPrintedByTheCommand) {
    sandbox_config config;
    invocation_builder builder;
    builder.then(make_unique<time_wrapper>("/usr/bin/time", "/app/time_output.txt"))
        .then(make_unique<timeout_wrapper>("timeout", 2, 1))
        .then(make_unique<prlimit_wrapper>("prlimit", 1024, 10))
        .then(make_unique<bwrap_wrapper>(config, "/srv/run", vector<bind_mount>{}));

    // the command printed the line itself and then died of a signal
    EXPECT_FALSE(builder.find_diagnostic(137, "timeout: x\n"));
    EXPECT_FALSE(builder.find_diagnostic(0, "bwrap: x\n"));
    // exit code 1 is a failure of bwrap and prlimit, not of timeout
    EXPECT_FALSE(builder.find_diagnostic(1, "timeout: x\n"));
    EXPECT_TRUE(builder.find_diagnostic(125, "timeout: invalid time interval\n"));
    EXPECT_TRUE(builder.find_diagnostic(1, "prlimit: failed to set the AS resource limit\n"));
}

TEST(InvocationBuilderTest, TinyTimeLimitNeverDisablesTimeout) {
    timeout_wrapper wrapper("timeout", 0.0001, 1);
    vector<string> argv = wrapper.wrap({"./main"});
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[2], "0.001s");

    EXPECT_EQ(timeout_wrapper("timeout", 0, 1).wrap({"./main"})[2], "0.001s");
    EXPECT_EQ(timeout_wrapper("timeout", 1.5, 1).wrap({"./main"})[2], "1.500s");
}
