#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/sandbox_config.hpp"
#include "sandbox/time_result.hpp"
#include "sandbox/workspace.hpp"

namespace bubble {

/**
 * @brief One command to run inside the sandbox
 */
struct run_request {
    /**
     * @brief argv as seen inside the sandbox
     */
    std::vector<std::string> command;

    /**
     * @brief Host directory mounted writable at workspace_in_container, also the cwd
     * The resource usage record is written here.
     */
    std::filesystem::path workdir;

    /**
     * @brief Additional read-only bind mounts, e.g. the prepared program
     */
    std::vector<bind_mount> extra_binds;

    /**
     * @brief Address space limit in KB
     */
    int64_t memory_limit = 256 * 1024;

    /**
     * @brief Declared file size limit in KB, fsize_factor is applied on top
     */
    int64_t file_limit = 2 * 1024;

    /**
     * @brief Seconds before the wall-clock guard kills the process group
     */
    double time_limit = 5;

    std::string stdin_payload;

    /**
     * @brief At most this many bytes of stdout and of stderr are kept
     */
    size_t output_limit = 2 * 1024 * 1024;
};

/**
 * @brief What the sandbox observed, nothing is interpreted yet
 */
struct raw_run {
    /**
     * @brief The fully wrapped argv that was executed
     */
    std::vector<std::string> command;

    int return_code = -1;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief Record of the measurement wrapper, absent if it was killed before writing it
     * The record lives in a directory the command can write, so it only feeds metrics.
     */
    std::optional<time_result> usage;

    /**
     * @brief The wall-clock guard or the host watchdog killed the run
     */
    bool guard_killed = false;

    /**
     * @brief Wall clock time measured by the host, covers the wrappers too
     */
    double wall_time = 0;

    /**
     * @brief Elapsed time charged to the run, always the host wall time
     */
    double elapsed() const;
};

/**
 * @brief Runs commands in an isolated environment bound to one workspace
 * Runs on one instance are serialized by the caller through workspace::acquire.
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief Run one command and wait for the whole process tree
     * The workspace is never reset here, callers do it explicitly.
     * @throw sandbox_error if the isolation primitive or a wrapper could not run
     */
    virtual raw_run execute(const run_request &request) = 0;

    virtual const sandbox_config &config() const = 0;

    virtual bubble::workspace &get_workspace() = 0;
};

/**
 * @brief Sandbox based on bubblewrap
 * bwrap -> prlimit -> timeout -> time -> command
 */
struct bwrap_sandbox : public sandbox {
    /**
     * @param config validated isolation settings, the workspace directory is created
     */
    explicit bwrap_sandbox(sandbox_config config);

    raw_run execute(const run_request &request) override;

    const sandbox_config &config() const override;

    bubble::workspace &get_workspace() override;

private:
    sandbox_config cfg;
    bubble::workspace ws;
};

}  // namespace bubble
