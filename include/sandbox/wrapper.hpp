#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/sandbox_config.hpp"

/**
 * Every concern of a sandboxed invocation is one wrapper that turns a command
 * into a longer command. The sandbox stacks them from the inside out:
 *
 *   bwrap ... -- prlimit ... -- timeout ... time -f ... -o ... <command>
 *   isolation   limit guard     wall-clock guard  measurement
 */
namespace bubble {

struct command_wrapper {
    virtual ~command_wrapper() = default;

    /**
     * @brief Wrap a command
     * @param inner the command to run under this wrapper
     * @return the command running this wrapper around inner
     */
    virtual std::vector<std::string> wrap(const std::vector<std::string> &inner) const = 0;

    /**
     * @brief The tool this wrapper starts
     * Diagnostics of the tool itself are written to stderr prefixed by its name.
     */
    virtual std::string tool() const = 0;

    /**
     * @brief Whether the tool itself exits with this code when it fails
     * Any other code belongs to the wrapped command.
     */
    virtual bool failed(int return_code) const = 0;
};

/**
 * @brief Measurement wrapper, GNU time writing the record to its own file
 * The record never interleaves with stdout/stderr of the command.
 */
struct time_wrapper : public command_wrapper {
    /**
     * @param time_path path of GNU time, the shell builtin does not support -f/-o
     * @param output_file where the record is written, as seen by the wrapper
     */
    time_wrapper(std::string time_path, std::string output_file);

    std::vector<std::string> wrap(const std::vector<std::string> &inner) const override;
    std::string tool() const override;
    bool failed(int return_code) const override;

private:
    std::string time_path, output_file;
};

/**
 * @brief Wall-clock guard
 * Runs without --foreground so that timeout puts the command into its own
 * process group and signals the whole group when the limit expires.
 */
struct timeout_wrapper : public command_wrapper {
    /**
     * @brief exit code of timeout when the limit expired
     */
    static constexpr int EXIT_TIMEDOUT = 124;

    /**
     * @brief exit code of timeout when it failed itself
     */
    static constexpr int EXIT_FAILED = 125;

    /**
     * @brief Shortest duration passed to timeout, a duration of 0 disables the limit
     */
    static constexpr double MIN_TIME_LIMIT = 0.001;

    /**
     * @param time_limit seconds before SIGTERM
     * @param kill_after seconds between SIGTERM and SIGKILL
     */
    timeout_wrapper(std::string timeout_path, double time_limit, double kill_after);

    std::vector<std::string> wrap(const std::vector<std::string> &inner) const override;
    std::string tool() const override;
    bool failed(int return_code) const override;

private:
    std::string timeout_path;
    double time_limit, kill_after;
};

/**
 * @brief Resource-limit guard, caps address space and size of written files
 */
struct prlimit_wrapper : public command_wrapper {
    /**
     * @param memory_limit address space limit in KB
     * @param file_limit file size limit in KB
     */
    prlimit_wrapper(std::string prlimit_path, int64_t memory_limit, int64_t file_limit);

    std::vector<std::string> wrap(const std::vector<std::string> &inner) const override;
    std::string tool() const override;
    bool failed(int return_code) const override;

private:
    std::string prlimit_path;
    int64_t memory_limit, file_limit;
};

/**
 * @brief Isolation primitive, bubblewrap
 * The working directory is the only writable bind mount and becomes the cwd.
 */
struct bwrap_wrapper : public command_wrapper {
    /**
     * @param config mounts, hostname and environment of the sandbox
     * @param workdir host directory mounted writable at config.workspace_in_container
     * @param extra_binds additional read-only bind mounts, e.g. the prepared program
     */
    bwrap_wrapper(const sandbox_config &config, std::filesystem::path workdir, std::vector<bind_mount> extra_binds);

    std::vector<std::string> wrap(const std::vector<std::string> &inner) const override;
    std::string tool() const override;
    bool failed(int return_code) const override;

private:
    const sandbox_config &config;
    std::filesystem::path workdir;
    std::vector<bind_mount> extra_binds;
};

/**
 * @brief Declarative composition of wrappers
 * @code{.cpp}
 *     invocation_builder builder;
 *     builder.then(std::make_unique<time_wrapper>("/usr/bin/time", "/app/time.txt"))
 *            .then(std::make_unique<timeout_wrapper>("timeout", 1, 1));
 *     // timeout --kill-after=1.000s 1.000s /usr/bin/time -f ... -o /app/time.txt ./main
 *     auto argv = builder.build({"./main"});
 * @endcode
 */
struct invocation_builder {
    /**
     * @brief Add a wrapper outside of all wrappers added so far
     */
    invocation_builder &then(std::unique_ptr<command_wrapper> wrapper);

    std::vector<std::string> build(const std::vector<std::string> &inner) const;

    /**
     * @brief Find the first stderr line written by a wrapper tool that failed
     * A line belongs to a tool if it starts with "<tool>: " or "<dir>/<tool>: ",
     * and only counts if return_code is one of the failure codes of that tool.
     * The command writes to the same stderr, so a matching line alone proves nothing.
     * @return the diagnostic line, if any
     */
    std::optional<std::string> find_diagnostic(int return_code, const std::string &stderr_data) const;

private:
    // innermost first
    std::vector<std::unique_ptr<command_wrapper>> layers;
};

}  // namespace bubble
