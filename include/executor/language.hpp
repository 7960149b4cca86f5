#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

/**
 * A language adapter turns source code into a command that runs it:
 * 1. prepare: write the source code into the program directory
 * 2. compile: build an artifact inside the sandbox, compiled languages only
 * 3. run_command: the argv that runs the artifact or the source file
 */
namespace bubble {

/**
 * @brief Outcome of the compile step
 */
struct compile_outcome {
    bool success = false;

    /**
     * @brief File name of the artifact inside the program directory
     */
    std::string artifact;

    /**
     * @brief Compiler output, stdout followed by stderr
     */
    std::string log;

    int return_code = -1;

    /**
     * @brief Elapsed seconds of the compiler
     */
    double duration = 0;

    std::string command;
};

struct language {
    virtual ~language() = default;

    /**
     * @brief Write the source code into the program directory
     * @param source_code content of the source file
     * @param program_dir host directory, already emptied by the caller
     * @return the name of the source file inside program_dir
     */
    virtual std::string prepare(const std::string &source_code, const std::filesystem::path &program_dir) const = 0;

    virtual bool needs_compilation() const = 0;

    /**
     * @brief Compile the prepared source file inside the sandbox
     * The program directory is the writable working directory of the compiler.
     * @throw sandbox_error if the compiler could not be started at all
     */
    virtual compile_outcome compile(const std::string &source_file, sandbox &box, const std::filesystem::path &program_dir) const;

    /**
     * @brief The argv running the program
     * @param program_dir where the program directory appears inside the sandbox
     * @param file the artifact for compiled languages, the source file otherwise
     */
    virtual std::vector<std::string> run_command(const std::string &program_dir, const std::string &file) const = 0;
};

/**
 * @brief Languages run by an interpreter, no compile step
 */
struct interpreted_language : public language {
    std::string interpreter = "/usr/bin/python3";

    /**
     * @brief Arguments passed to the interpreter before the source file
     */
    std::vector<std::string> args;

    std::string source_name = "main.py";

    std::string prepare(const std::string &source_code, const std::filesystem::path &program_dir) const override;
    bool needs_compilation() const override;
    std::vector<std::string> run_command(const std::string &program_dir, const std::string &file) const override;
};

/**
 * @brief Languages compiled to a native executable
 * The compiler runs as "<compiler> <source> -o <artifact> <flags...>".
 */
struct compiled_language : public language {
    std::string compiler = "/usr/bin/g++";
    std::vector<std::string> flags = {"-std=c++17", "-O2"};
    std::string source_name = "main.cpp";
    std::string artifact_name = "main";

    /**
     * @brief Limits of the compiler, default to COMPILE_TIME_LIMIT, COMPILE_MEM_LIMIT and COMPILE_FILE_LIMIT
     */
    double compile_time_limit;
    int64_t compile_memory_limit;
    int64_t compile_file_limit;

    /**
     * @brief At most this many bytes of compiler output are kept
     */
    size_t compile_output_limit = 64 * 1024;

    compiled_language();

    std::string prepare(const std::string &source_code, const std::filesystem::path &program_dir) const override;
    bool needs_compilation() const override;
    compile_outcome compile(const std::string &source_file, sandbox &box, const std::filesystem::path &program_dir) const override;
    std::vector<std::string> run_command(const std::string &program_dir, const std::string &file) const override;
};

/**
 * @brief Missing keys keep their default values
 */
void from_json(const nlohmann::json &j, interpreted_language &lang);
void from_json(const nlohmann::json &j, compiled_language &lang);

using language_factory = std::function<std::unique_ptr<language>(const nlohmann::json &)>;

/**
 * @brief Make a language available to make_language
 * "python" and "cpp" are registered by default.
 */
void register_language(const std::string &name, language_factory factory);

/**
 * @brief Create the adapter named by j["language"], configured by the other keys of j
 * @code{.json}
 *     {"language": "cpp", "compiler": "/usr/bin/g++", "flags": ["-std=c++17", "-O2"]}
 * @endcode
 * @throw config_error for unknown languages or malformed settings
 */
std::unique_ptr<language> make_language(const nlohmann::json &j);

}  // namespace bubble
