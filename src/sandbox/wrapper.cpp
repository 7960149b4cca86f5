#include "sandbox/wrapper.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <sstream>
#include "sandbox/time_result.hpp"

namespace bubble {
using namespace std;
namespace fs = std::filesystem;

static vector<string> concat(vector<string> outer, const vector<string> &inner) {
    outer.insert(outer.end(), inner.begin(), inner.end());
    return outer;
}

time_wrapper::time_wrapper(string time_path, string output_file)
    : time_path(move(time_path)), output_file(move(output_file)) {}

vector<string> time_wrapper::wrap(const vector<string> &inner) const {
    return concat({time_path, "-f", TIME_FORMAT, "-o", output_file}, inner);
}

string time_wrapper::tool() const {
    return time_path;
}

bool time_wrapper::failed(int return_code) const {
    // 126: command found but not runnable, 127: command not found
    return return_code == 126 || return_code == 127;
}

timeout_wrapper::timeout_wrapper(string timeout_path, double time_limit, double kill_after)
    : timeout_path(move(timeout_path)), time_limit(time_limit), kill_after(kill_after) {}

vector<string> timeout_wrapper::wrap(const vector<string> &inner) const {
    return concat({timeout_path,
                   fmt::format("--kill-after={:.3f}s", kill_after),
                   fmt::format("{:.3f}s", max(time_limit, MIN_TIME_LIMIT))},
                  inner);
}

string timeout_wrapper::tool() const {
    return timeout_path;
}

bool timeout_wrapper::failed(int return_code) const {
    return return_code == EXIT_FAILED || return_code == 126 || return_code == 127;
}

prlimit_wrapper::prlimit_wrapper(string prlimit_path, int64_t memory_limit, int64_t file_limit)
    : prlimit_path(move(prlimit_path)), memory_limit(memory_limit), file_limit(file_limit) {}

vector<string> prlimit_wrapper::wrap(const vector<string> &inner) const {
    return concat({prlimit_path,
                   fmt::format("--as={}", memory_limit * 1024),
                   fmt::format("--fsize={}", file_limit * 1024),
                   "--"},
                  inner);
}

string prlimit_wrapper::tool() const {
    return prlimit_path;
}

bool prlimit_wrapper::failed(int return_code) const {
    return return_code == 1 || return_code == 126 || return_code == 127;
}

bwrap_wrapper::bwrap_wrapper(const sandbox_config &config, fs::path workdir, vector<bind_mount> extra_binds)
    : config(config), workdir(move(workdir)), extra_binds(move(extra_binds)) {}

vector<string> bwrap_wrapper::wrap(const vector<string> &inner) const {
    vector<string> cmd = {config.bwrap_path, "--unshare-all", "--die-with-parent", "--new-session"};

    for (auto &mount : config.bind_mounts) {
        if (!fs::exists(mount.host_path)) {
            LOG(WARNING) << "Bind mount source " << mount.host_path << " does not exist. Skipping bind mount.";
            continue;
        }
        cmd.insert(cmd.end(), {"--ro-bind", mount.host_path, mount.container_path});
    }

    cmd.insert(cmd.end(), {"--bind", workdir.string(), config.workspace_in_container,
                           "--chdir", config.workspace_in_container});

    for (auto &mount : extra_binds)
        cmd.insert(cmd.end(), {"--ro-bind", mount.host_path, mount.container_path});

    for (auto &[name, path] : config.executable_paths) {
        if (!path.empty() && fs::exists(path)) {
            string container_path = (fs::path(config.workspace_in_container) / name).string();
            cmd.insert(cmd.end(), {"--ro-bind", path, container_path});
        } else {
            LOG(WARNING) << "Executable path " << path << " does not exist. Skipping bind mount.";
        }
    }

    for (auto &path : config.tmpfs_paths)
        cmd.insert(cmd.end(), {"--tmpfs", path});
    if (config.use_proc)
        cmd.insert(cmd.end(), {"--proc", "/proc"});
    if (config.use_dev)
        cmd.insert(cmd.end(), {"--dev", "/dev"});
    cmd.insert(cmd.end(), {"--hostname", config.hostname, "--clearenv"});
    for (auto &[key, value] : config.env_vars)
        cmd.insert(cmd.end(), {"--setenv", key, value});

    cmd.push_back("--");
    return concat(move(cmd), inner);
}

string bwrap_wrapper::tool() const {
    return config.bwrap_path;
}

bool bwrap_wrapper::failed(int return_code) const {
    return return_code == 1;
}

invocation_builder &invocation_builder::then(unique_ptr<command_wrapper> wrapper) {
    layers.push_back(move(wrapper));
    return *this;
}

vector<string> invocation_builder::build(const vector<string> &inner) const {
    vector<string> cmd = inner;
    for (auto &layer : layers)
        cmd = layer->wrap(cmd);
    return cmd;
}

optional<string> invocation_builder::find_diagnostic(int return_code, const string &stderr_data) const {
    istringstream fin(stderr_data);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) continue;
        string origin = fs::path(line.substr(0, end)).filename().string();
        for (auto &layer : layers) {
            if (layer->failed(return_code) && origin == fs::path(layer->tool()).filename().string())
                return line;
        }
    }
    return nullopt;
}

}  // namespace bubble
