#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "config.hpp"

namespace bubble {

/**
 * @brief A host path exposed at a path inside the sandbox
 */
struct bind_mount {
    std::string host_path;
    std::string container_path;
};

void from_json(const nlohmann::json &j, bind_mount &mount);

/**
 * @brief Describes the isolation environment of one sandbox instance
 * Constructed once per instance and read-only afterwards.
 */
struct sandbox_config {
    /**
     * @brief Host directory owned by the sandbox instance, made absolute by the sandbox
     *
     * workspace
     * ├── .lock // flock held while a request is running
     * ├── program // source code and compiled artifact, read-only at program_in_container during runs
     * └── run // writable root of every run, emptied before each input
     *     └── time_output.txt // resource usage record of the last run
     */
    std::filesystem::path workspace = "./workspace";

    /**
     * @brief Where the writable working directory appears inside the sandbox, also the cwd
     */
    std::string workspace_in_container = "/app";

    /**
     * @brief Where the prepared program directory appears inside the sandbox during runs
     */
    std::string program_in_container = "/program";

    std::string bwrap_path = "bwrap";
    std::string time_path = "/usr/bin/time";
    std::string timeout_path = "timeout";
    std::string prlimit_path = "prlimit";

    /**
     * @brief Read-only bind mounts, in mount order
     * Host paths that do not exist are skipped.
     */
    std::vector<bind_mount> bind_mounts = {
        {"/usr", "/usr"},
        {"/lib", "/lib"},
        {"/lib64", "/lib64"},
        {"/bin", "/bin"},
        {"/sbin", "/sbin"},
        {"/etc", "/etc"},
        {"/home", "/home"},
    };

    /**
     * @brief Executables to expose inside the working directory
     * name -> host path, mounted read-only at workspace_in_container/name
     */
    std::map<std::string, std::string> executable_paths;

    /**
     * @brief Paths mounted as fresh tmpfs
     */
    std::vector<std::string> tmpfs_paths = {"/tmp"};

    /**
     * @brief Mount a new procfs at /proc
     */
    bool use_proc = true;

    /**
     * @brief Mount a minimal devtmpfs at /dev
     */
    bool use_dev = true;

    std::string hostname = "sandbox";

    /**
     * @brief The complete environment of the sandboxed command, nothing is inherited
     */
    std::map<std::string, std::string> env_vars = {{"PATH", "/usr/bin:/bin"}};

    /**
     * @brief The file size limit is the declared output limit multiplied by this factor
     * Leaves slack for filesystem metadata overhead.
     */
    double fsize_factor = 1.1;

    /**
     * @brief Where the measurement wrapper writes its record, relative to the working directory
     */
    std::string time_output_relative_path = "time_output.txt";

    /**
     * @brief Seconds between SIGTERM and SIGKILL when the wall-clock guard fires, default to KILL_AFTER
     */
    double kill_after = KILL_AFTER;

    /**
     * @brief Check the values that can not be checked by the type system
     * @throw config_error
     */
    void validate() const;
};

/**
 * @brief Missing keys keep their default values
 */
void from_json(const nlohmann::json &j, sandbox_config &config);

}  // namespace bubble
