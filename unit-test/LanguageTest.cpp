#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "executor/language.hpp"
#include "test/mock_sandbox.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace bubble;
using ::testing::ElementsAre;
namespace fs = std::filesystem;

TEST(LanguageTest, PythonRunsSourceWithInterpreter) {
    test::temp_dir dir("language");
    auto lang = make_language(nlohmann::json{{"language", "python"}});
    EXPECT_FALSE(lang->needs_compilation());

    string file = lang->prepare("print(1)\n", dir.path);
    EXPECT_EQ(file, "main.py");
    EXPECT_EQ(read_file_content(dir.path / "main.py"), "print(1)\n");
    EXPECT_THAT(lang->run_command("/program", file), ElementsAre("/usr/bin/python3", "/program/main.py"));
}

TEST(LanguageTest, InterpreterSettings) {
    auto lang = make_language(nlohmann::json{{"language", "python3"}, {"interpreter", "python3.11"}, {"args", {"-S", "-B"}}});
    EXPECT_THAT(lang->run_command("/program", "main.py"), ElementsAre("python3.11", "-S", "-B", "/program/main.py"));
}

TEST(LanguageTest, CppCompileCommandAndLimits) {
    test::temp_dir dir("language");
    test::mock_sandbox box(dir.path / "ws");
    auto lang = make_language(nlohmann::json{{"language", "cpp"}});
    ASSERT_TRUE(lang->needs_compilation());

    fs::path program_dir = box.get_workspace().program_dir();
    box.get_workspace().reset();
    string file = lang->prepare("int main() {}\n", program_dir);
    EXPECT_EQ(file, "main.cpp");

    box.handler = [&](const run_request &request) {
        write_file_content(request.workdir / "main", "ELF");
        return test::finished_run(0, 1.25);
    };
    compile_outcome outcome = lang->compile(file, box, program_dir);

    ASSERT_EQ(box.requests.size(), 1u);
    const run_request &request = box.requests[0];
    EXPECT_THAT(request.command, ElementsAre("/usr/bin/g++", "main.cpp", "-o", "main", "-std=c++17", "-O2"));
    EXPECT_EQ(request.workdir, program_dir);
    EXPECT_TRUE(request.extra_binds.empty());
    EXPECT_DOUBLE_EQ(request.time_limit, COMPILE_TIME_LIMIT);
    EXPECT_EQ(request.memory_limit, COMPILE_MEM_LIMIT);
    EXPECT_EQ(request.file_limit, COMPILE_FILE_LIMIT);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.artifact, "main");
    EXPECT_DOUBLE_EQ(outcome.duration, 1.25);
    EXPECT_THAT(lang->run_command("/program", outcome.artifact), ElementsAre("/program/main"));
}

TEST(LanguageTest, CppCompileFailureKeepsLog) {
    test::temp_dir dir("language");
    test::mock_sandbox box(dir.path / "ws");
    auto lang = make_language(nlohmann::json{{"language", "cpp"}, {"flags", nlohmann::json::array({"-std=c++14"})}});

    raw_run run = test::finished_run(1, 0.4);
    run.stderr_data = "main.cpp:1:1: error: expected unqualified-id\n";
    box.will_return(run);

    compile_outcome outcome = lang->compile("main.cpp", box, box.get_workspace().program_dir());
    EXPECT_THAT(box.requests[0].command, ElementsAre("/usr/bin/g++", "main.cpp", "-o", "main", "-std=c++14"));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.return_code, 1);
    EXPECT_THAT(outcome.log, ::testing::HasSubstr("expected unqualified-id"));
}

TEST(LanguageTest, CppCompileTimeout) {
    test::temp_dir dir("language");
    test::mock_sandbox box(dir.path / "ws");
    auto lang = make_language(nlohmann::json{{"language", "cpp"}, {"compile_time_limit", 2}});

    raw_run run;
    run.return_code = 124;
    run.guard_killed = true;
    run.wall_time = 2.01;
    box.will_return(run);

    compile_outcome outcome = lang->compile("main.cpp", box, box.get_workspace().program_dir());
    EXPECT_DOUBLE_EQ(box.requests[0].time_limit, 2);
    EXPECT_FALSE(outcome.success);
    EXPECT_DOUBLE_EQ(outcome.duration, 2.01);
    EXPECT_THAT(outcome.log, ::testing::HasSubstr("time limit"));
}

TEST(LanguageTest, UnknownLanguageThrows) {
    EXPECT_THROW(make_language(nlohmann::json{{"language", "cobol"}}), config_error);
    EXPECT_THROW(make_language(nlohmann::json::object()), config_error);
    EXPECT_THROW(make_language(nlohmann::json{{"language", "cpp"}, {"flags", 3}}), config_error);
}

TEST(LanguageTest, RegisteredLanguagesAreCreatedByName) {
    register_language("pypy", [](const nlohmann::json &j) {
        auto lang = make_unique<interpreted_language>();
        lang->interpreter = "/usr/bin/pypy3";
        from_json(j, *lang);
        return unique_ptr<language>(move(lang));
    });
    auto lang = make_language(nlohmann::json{{"language", "pypy"}});
    EXPECT_THAT(lang->run_command("/program", "main.py"), ElementsAre("/usr/bin/pypy3", "/program/main.py"));
}
