#include "sandbox/sandbox_config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace bubble {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, bind_mount &mount) {
    if (j.is_array()) {
        j.at(0).get_to(mount.host_path);
        j.at(1).get_to(mount.container_path);
    } else {
        j.at("host").get_to(mount.host_path);
        if (j.count("container"))
            j.at("container").get_to(mount.container_path);
        else
            mount.container_path = mount.host_path;
    }
}

void from_json(const json &j, sandbox_config &config) {
    if (j.count("workspace"))
        config.workspace = j.at("workspace").get<string>();
    if (j.count("workspace_in_container"))
        j.at("workspace_in_container").get_to(config.workspace_in_container);
    if (j.count("program_in_container"))
        j.at("program_in_container").get_to(config.program_in_container);
    if (j.count("bwrap_path"))
        j.at("bwrap_path").get_to(config.bwrap_path);
    if (j.count("time_path"))
        j.at("time_path").get_to(config.time_path);
    if (j.count("timeout_path"))
        j.at("timeout_path").get_to(config.timeout_path);
    if (j.count("prlimit_path"))
        j.at("prlimit_path").get_to(config.prlimit_path);
    if (j.count("bind_mounts"))
        j.at("bind_mounts").get_to(config.bind_mounts);
    if (j.count("executable_paths"))
        j.at("executable_paths").get_to(config.executable_paths);
    if (j.count("tmpfs_paths"))
        j.at("tmpfs_paths").get_to(config.tmpfs_paths);
    if (j.count("use_proc"))
        j.at("use_proc").get_to(config.use_proc);
    if (j.count("use_dev"))
        j.at("use_dev").get_to(config.use_dev);
    if (j.count("hostname"))
        j.at("hostname").get_to(config.hostname);
    if (j.count("env_vars"))
        j.at("env_vars").get_to(config.env_vars);
    if (j.count("fsize_factor"))
        j.at("fsize_factor").get_to(config.fsize_factor);
    if (j.count("time_output_relative_path"))
        j.at("time_output_relative_path").get_to(config.time_output_relative_path);
    if (j.count("kill_after"))
        j.at("kill_after").get_to(config.kill_after);
}

static void assert_container_path(const string &name, const string &path) {
    if (path.empty() || path.front() != '/')
        throw config_error(fmt::format("{} must be an absolute path inside the sandbox, got '{}'", name, path));
}

void sandbox_config::validate() const {
    if (workspace.empty())
        throw config_error("workspace must not be empty");
    assert_container_path("workspace_in_container", workspace_in_container);
    assert_container_path("program_in_container", program_in_container);
    if (workspace_in_container == program_in_container)
        throw config_error("workspace_in_container and program_in_container must differ");
    for (auto &mount : bind_mounts) {
        if (mount.host_path.empty())
            throw config_error("bind mount with empty host path");
        assert_container_path("bind mount target", mount.container_path);
    }
    for (auto &path : tmpfs_paths)
        assert_container_path("tmpfs path", path);
    for (auto &[name, path] : executable_paths) {
        try {
            assert_safe_path(name);
        } catch (runtime_error &e) {
            throw config_error(fmt::format("invalid executable name '{}': {}", name, e.what()));
        }
    }
    if (!(fsize_factor >= 1))
        throw config_error(fmt::format("fsize_factor must be at least 1, got {}", fsize_factor));
    if (!(kill_after >= 0))
        throw config_error(fmt::format("kill_after must not be negative, got {}", kill_after));
    try {
        assert_safe_path(time_output_relative_path);
    } catch (runtime_error &e) {
        throw config_error(fmt::format("invalid time_output_relative_path: {}", e.what()));
    }
}

}  // namespace bubble
