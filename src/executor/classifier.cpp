#include "executor/classifier.hpp"
#include <fmt/core.h>
#include <signal.h>
#include <string.h>

namespace bubble {
using namespace std;

// messages printed by the runtimes when an allocation fails under the address space limit
static const char *ALLOCATION_FAILURES[] = {
    "MemoryError",
    "std::bad_alloc",
    "Cannot allocate memory",
    "out of memory",
};

optional<int> termination_signal(int return_code) {
    if (return_code > 128 && return_code < 128 + NSIG)
        return return_code - 128;
    return nullopt;
}

static bool allocation_failed(const classify_input &in) {
    if (in.return_code == 128 + SIGKILL && !in.guard_killed)
        return true;
    for (const char *message : ALLOCATION_FAILURES)
        if (in.stderr_data.find(message) != string_view::npos)
            return true;
    return false;
}

execution_status classify(const classify_input &in, const resource_limits &limits) {
    if (in.input_size > (size_t)limits.max_input_size * 1024)
        return execution_status::INPUT_LIMIT_EXCEEDED;

    if (in.compile_failed)
        return execution_status::COMPILE_ERROR;

    if ((in.guard_killed && !in.budget_capped) || in.elapsed >= limits.time_limit)
        return execution_status::TIME_LIMIT_EXCEEDED;

    if ((in.guard_killed && in.budget_capped) || in.cumulative_elapsed + in.elapsed >= limits.overall_time_limit)
        return execution_status::OVERALL_TIME_LIMIT_EXCEEDED;

    if ((in.usage && in.usage->max_resident_set_size >= limits.memory_limit) ||
        (in.return_code != 0 && allocation_failed(in)))
        return execution_status::MEMORY_LIMIT_EXCEEDED;

    if (in.stdout_truncated || in.stderr_truncated || in.return_code == 128 + SIGXFSZ)
        return execution_status::OUTPUT_LIMIT_EXCEEDED;

    if (in.return_code != 0)
        return execution_status::RUNTIME_ERROR;

    return execution_status::SUCCESS;
}

optional<string> explain(execution_status status, const classify_input &in, const resource_limits &limits) {
    switch (status) {
        case execution_status::SUCCESS:
            return nullopt;
        case execution_status::INPUT_LIMIT_EXCEEDED:
            return fmt::format("Input limit exceeded. Input size: {} bytes, limit: {} KB.", in.input_size, limits.max_input_size);
        case execution_status::COMPILE_ERROR:
            return "Compilation failed.";
        case execution_status::TIME_LIMIT_EXCEEDED:
            return fmt::format("Time limit exceeded. Execution time: {:.3f} seconds.", in.elapsed);
        case execution_status::OVERALL_TIME_LIMIT_EXCEEDED:
            return fmt::format("Overall time limit exceeded. Cumulative execution time: {:.3f} seconds, limit: {} seconds.",
                               in.cumulative_elapsed + in.elapsed, limits.overall_time_limit);
        case execution_status::MEMORY_LIMIT_EXCEEDED:
            if (in.usage)
                return fmt::format("Memory limit exceeded. Peak memory: {} KB.", in.usage->max_resident_set_size);
            return fmt::format("Memory limit exceeded. Allocation failed under the limit of {} KB.", limits.memory_limit);
        case execution_status::OUTPUT_LIMIT_EXCEEDED:
            return fmt::format("Output limit exceeded. Limit: {} KB.", limits.max_output_size);
        case execution_status::RUNTIME_ERROR:
            if (auto sig = termination_signal(in.return_code))
                return fmt::format("Runtime error. Terminated by signal {} ({}).", *sig, strsignal(*sig));
            return fmt::format("Runtime error. Return code: {}.", in.return_code);
        case execution_status::INTERNAL_ERROR:
            return "Internal error.";
    }
    return nullopt;
}

}  // namespace bubble
