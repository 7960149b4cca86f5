#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/process.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/wrapper.hpp"

namespace bubble {
using namespace std;
namespace fs = std::filesystem;

double raw_run::elapsed() const {
    return wall_time;
}

static sandbox_config validated(sandbox_config config) {
    config.validate();
    return config;
}

bwrap_sandbox::bwrap_sandbox(sandbox_config config)
    : cfg(validated(move(config))), ws(cfg.workspace) {
    cfg.workspace = ws.root();
}

const sandbox_config &bwrap_sandbox::config() const {
    return cfg;
}

workspace &bwrap_sandbox::get_workspace() {
    return ws;
}

raw_run bwrap_sandbox::execute(const run_request &request) {
    string record_in_container = (fs::path(cfg.workspace_in_container) / cfg.time_output_relative_path).string();
    fs::path record_on_host = request.workdir / assert_safe_path(cfg.time_output_relative_path);

    // a record left over from an earlier run must never be attributed to this one
    error_code ec;
    fs::remove(record_on_host, ec);
    if (ec) throw internal_error(fmt::format("unable to remove stale usage record {}: {}", record_on_host, ec.message()));

    int64_t file_limit = (int64_t)floor(request.file_limit * cfg.fsize_factor);

    invocation_builder builder;
    builder.then(make_unique<time_wrapper>(cfg.time_path, record_in_container))
        .then(make_unique<timeout_wrapper>(cfg.timeout_path, request.time_limit, cfg.kill_after))
        .then(make_unique<prlimit_wrapper>(cfg.prlimit_path, request.memory_limit, file_limit))
        .then(make_unique<bwrap_wrapper>(cfg, request.workdir, request.extra_binds));

    process_options opt;
    opt.command = builder.build(request.command);
    opt.stdin_payload = request.stdin_payload;
    opt.stream_limit = request.output_limit;
    opt.watchdog = request.time_limit + cfg.kill_after + WATCHDOG_SLACK;

    LOG(INFO) << "running " << join_command(opt.command);

    process_result proc = run_process(opt);

    raw_run run;
    run.command = move(opt.command);
    run.return_code = proc.exitcode;
    run.stdout_data = move(proc.stdout_data);
    run.stderr_data = move(proc.stderr_data);
    run.stdout_truncated = proc.stdout_truncated;
    run.stderr_truncated = proc.stderr_truncated;
    run.wall_time = proc.wall_time;
    run.guard_killed = proc.watchdog_fired || proc.exitcode == timeout_wrapper::EXIT_TIMEDOUT;
    bool record_created = fs::exists(record_on_host, ec);
    run.usage = read_time_result(record_on_host);

    if (!record_created && !run.guard_killed) {
        // GNU time creates the record before it starts the command, so the command never ran
        if (auto diagnostic = builder.find_diagnostic(run.return_code, run.stderr_data))
            throw sandbox_error(*diagnostic);
    }
    if (!run.usage)
        LOG(WARNING) << "no usable usage record produced by " << join_command(request.command);

    return run;
}

}  // namespace bubble
