#include "executor/pipeline.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <optional>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "executor/classifier.hpp"

namespace bubble {
using namespace std;
namespace fs = std::filesystem;

execution_pipeline::execution_pipeline(sandbox &box, const language &lang)
    : box(box), lang(lang) {}

static execution_result skipped_result(execution_status status, const optional<string> &error) {
    execution_result result;
    result.status = status;
    result.error = error;
    return result;
}

execution_result execution_pipeline::run_input(const string &input, const vector<string> &command,
                                               const resource_limits &limits, double &cumulative) {
    workspace &ws = box.get_workspace();
    ws.reset_run();

    classify_input in;
    in.input_size = input.size();
    in.cumulative_elapsed = cumulative;

    if (cumulative >= limits.overall_time_limit) {
        LOG(INFO) << fmt::format("overall time budget used up after {:.3f} seconds, input skipped", cumulative);
        return skipped_result(execution_status::OVERALL_TIME_LIMIT_EXCEEDED,
                              explain(execution_status::OVERALL_TIME_LIMIT_EXCEEDED, in, limits));
    }

    double remaining = limits.overall_time_limit - cumulative;
    in.budget_capped = remaining < limits.time_limit;

    run_request request;
    request.command = command;
    request.workdir = ws.run_dir();
    request.extra_binds = {{ws.program_dir().string(), box.config().program_in_container}};
    request.memory_limit = limits.memory_limit;
    request.file_limit = limits.max_output_size;
    request.time_limit = in.budget_capped ? remaining : limits.time_limit;
    request.stdin_payload = input;
    request.output_limit = limits.max_output_size * 1024;

    raw_run run = box.execute(request);

    in.return_code = run.return_code;
    in.guard_killed = run.guard_killed;
    in.elapsed = run.elapsed();
    in.usage = run.usage;
    in.stdout_truncated = run.stdout_truncated;
    in.stderr_truncated = run.stderr_truncated;
    in.stderr_data = run.stderr_data;

    execution_result result;
    result.status = classify(in, limits);
    result.command = join_command(run.command);
    result.return_code = run.return_code;
    result.stdout_truncated = run.stdout_truncated;
    result.stderr_truncated = run.stderr_truncated;
    result.error = explain(result.status, in, limits);
    result.usage = run.usage;
    // a run cut short by the overall budget counts as not run
    bool cut_by_budget = result.status == execution_status::OVERALL_TIME_LIMIT_EXCEEDED && in.guard_killed && in.budget_capped;
    if (!cut_by_budget)
        result.execution_time = in.elapsed;
    result.stdout_data = move(run.stdout_data);
    result.stderr_data = move(run.stderr_data);

    cumulative += in.elapsed;
    LOG(INFO) << fmt::format("input finished with {} after {:.3f} seconds, {:.3f} seconds used in total",
                             status_name(result.status), in.elapsed, cumulative);
    return result;
}

vector<execution_result> execution_pipeline::run(const execution_request &request) {
    const resource_limits &limits = request.limits;
    size_t n = request.inputs.size();
    vector<execution_result> results(n);
    vector<bool> finished(n, false);

    auto fail_remaining = [&](execution_status status, const optional<string> &error) {
        for (size_t i = 0; i < n; ++i) {
            if (finished[i]) continue;
            results[i] = skipped_result(status, error);
            finished[i] = true;
        }
    };

    try {
        limits.validate();
    } catch (config_error &ex) {
        LOG(ERROR) << "invalid resource limits: " << ex.what();
        fail_remaining(execution_status::INTERNAL_ERROR, string(ex.what()));
        return results;
    }

    LOG(INFO) << fmt::format("running {} inputs with {}", n, limits.to_string());

    for (size_t i = 0; i < n; ++i) {
        classify_input in;
        in.input_size = request.inputs[i].size();
        execution_status status = classify(in, limits);
        if (status == execution_status::INPUT_LIMIT_EXCEEDED) {
            results[i] = skipped_result(status, explain(status, in, limits));
            finished[i] = true;
        }
    }

    try {
        workspace &ws = box.get_workspace();
        workspace_lock lock = ws.acquire();
        ws.reset();

        string file = lang.prepare(request.source_code, ws.program_dir());
        optional<double> compile_time;

        if (lang.needs_compilation()) {
            compile_outcome outcome = lang.compile(file, box, ws.program_dir());
            compile_time = outcome.duration;
            if (!outcome.success) {
                for (size_t i = 0; i < n; ++i) {
                    if (finished[i]) continue;
                    execution_result &result = results[i];
                    result.status = execution_status::COMPILE_ERROR;
                    result.command = outcome.command;
                    result.return_code = outcome.return_code;
                    result.compile_time = compile_time;
                    result.error = outcome.log;
                    finished[i] = true;
                }
                if (!DEBUG) ws.reset();
                return results;
            }
            file = outcome.artifact;
        }

        vector<string> command = lang.run_command(box.config().program_in_container, file);
        double cumulative = 0;
        for (size_t i = 0; i < n; ++i) {
            if (finished[i]) continue;
            results[i] = run_input(request.inputs[i], command, limits, cumulative);
            results[i].compile_time = compile_time;
            finished[i] = true;
        }

        if (!DEBUG) ws.reset();
    } catch (std::exception &ex) {
        LOG(ERROR) << "execution aborted: " << ex.what();
        fail_remaining(execution_status::INTERNAL_ERROR, string(ex.what()));
    }

    return results;
}

}  // namespace bubble
