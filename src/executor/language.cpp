#include "executor/language.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace bubble {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

compile_outcome language::compile(const string &, sandbox &, const fs::path &) const {
    throw internal_error("language does not need compilation");
}

string interpreted_language::prepare(const string &source_code, const fs::path &program_dir) const {
    write_file_content(program_dir / assert_safe_path(source_name), source_code);
    return source_name;
}

bool interpreted_language::needs_compilation() const {
    return false;
}

vector<string> interpreted_language::run_command(const string &program_dir, const string &file) const {
    vector<string> cmd = {interpreter};
    cmd.insert(cmd.end(), args.begin(), args.end());
    cmd.push_back((fs::path(program_dir) / file).string());
    return cmd;
}

compiled_language::compiled_language()
    : compile_time_limit(COMPILE_TIME_LIMIT), compile_memory_limit(COMPILE_MEM_LIMIT), compile_file_limit(COMPILE_FILE_LIMIT) {}

string compiled_language::prepare(const string &source_code, const fs::path &program_dir) const {
    write_file_content(program_dir / assert_safe_path(source_name), source_code);
    return source_name;
}

bool compiled_language::needs_compilation() const {
    return true;
}

compile_outcome compiled_language::compile(const string &source_file, sandbox &box, const fs::path &program_dir) const {
    run_request request;
    request.command = {compiler, source_file, "-o", assert_safe_path(artifact_name)};
    request.command.insert(request.command.end(), flags.begin(), flags.end());
    request.workdir = program_dir;
    request.memory_limit = compile_memory_limit;
    request.file_limit = compile_file_limit;
    request.time_limit = compile_time_limit;
    request.output_limit = compile_output_limit;

    raw_run run = box.execute(request);

    compile_outcome outcome;
    outcome.command = join_command(run.command);
    outcome.return_code = run.return_code;
    outcome.duration = run.elapsed();
    outcome.log = run.stdout_data + run.stderr_data;
    if (run.guard_killed) {
        outcome.log += fmt::format("\nCompilation time limit of {} seconds exceeded.", compile_time_limit);
    } else if (run.return_code == 0 && fs::is_regular_file(program_dir / artifact_name)) {
        outcome.success = true;
        outcome.artifact = artifact_name;
    }
    LOG(INFO) << fmt::format("compilation {} in {:.3f} seconds with return code {}",
                             outcome.success ? "succeeded" : "failed", outcome.duration, outcome.return_code);
    return outcome;
}

vector<string> compiled_language::run_command(const string &program_dir, const string &file) const {
    return {(fs::path(program_dir) / file).string()};
}

void from_json(const json &j, interpreted_language &lang) {
    if (j.count("interpreter"))
        j.at("interpreter").get_to(lang.interpreter);
    if (j.count("args"))
        j.at("args").get_to(lang.args);
    if (j.count("source_name"))
        j.at("source_name").get_to(lang.source_name);
}

void from_json(const json &j, compiled_language &lang) {
    if (j.count("compiler"))
        j.at("compiler").get_to(lang.compiler);
    if (j.count("flags"))
        j.at("flags").get_to(lang.flags);
    if (j.count("source_name"))
        j.at("source_name").get_to(lang.source_name);
    if (j.count("artifact_name"))
        j.at("artifact_name").get_to(lang.artifact_name);
    if (j.count("compile_time_limit"))
        j.at("compile_time_limit").get_to(lang.compile_time_limit);
    if (j.count("compile_memory_limit"))
        j.at("compile_memory_limit").get_to(lang.compile_memory_limit);
    if (j.count("compile_file_limit"))
        j.at("compile_file_limit").get_to(lang.compile_file_limit);
    if (j.count("compile_output_limit"))
        j.at("compile_output_limit").get_to(lang.compile_output_limit);
}

template <typename Lang>
static unique_ptr<language> make_configured(const json &j) {
    auto lang = make_unique<Lang>();
    from_json(j, *lang);
    return lang;
}

static map<string, language_factory> &languages() {
    static map<string, language_factory> registry = {
        {"python", language_factory(make_configured<interpreted_language>)},
        {"python3", language_factory(make_configured<interpreted_language>)},
        {"cpp", language_factory(make_configured<compiled_language>)},
        {"c++", language_factory(make_configured<compiled_language>)},
    };
    return registry;
}

void register_language(const string &name, language_factory factory) {
    languages()[name] = move(factory);
}

unique_ptr<language> make_language(const json &j) {
    string name;
    try {
        name = j.at("language").get<string>();
    } catch (json::exception &ex) {
        throw config_error(fmt::format("language name missing: {}", ex.what()));
    }
    auto it = languages().find(name);
    if (it == languages().end())
        throw config_error("unknown language " + name);
    try {
        return it->second(j);
    } catch (json::exception &ex) {
        throw config_error(fmt::format("malformed settings of language {}: {}", name, ex.what()));
    }
}

}  // namespace bubble
