#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "common/status.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/time_result.hpp"

namespace bubble {

/**
 * @brief Everything the classifier looks at for one input
 */
struct classify_input {
    /**
     * @brief Size of the input in bytes
     */
    size_t input_size = 0;

    bool compile_failed = false;

    /**
     * @brief Return code of the wrapped command, 128 + N if terminated by signal N
     */
    int return_code = 0;

    /**
     * @brief The wall-clock guard or the host watchdog killed the run
     */
    bool guard_killed = false;

    /**
     * @brief The guard of this run was shortened to the remaining overall budget
     * A guard kill is then caused by the overall budget, not by time_limit.
     */
    bool budget_capped = false;

    /**
     * @brief Elapsed wall clock seconds of this run
     */
    double elapsed = 0;

    /**
     * @brief Elapsed seconds of all earlier runs of the request
     */
    double cumulative_elapsed = 0;

    std::optional<time_result> usage;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief Searched for allocation failure messages of the runtimes
     */
    std::string_view stderr_data;
};

/**
 * @brief Decide the status of one run, the first matching rule wins
 * 1. input larger than max_input_size: INPUT_LIMIT_EXCEEDED
 * 2. compilation failed: COMPILE_ERROR
 * 3. killed by the wall-clock guard or elapsed >= time_limit: TIME_LIMIT_EXCEEDED
 * 4. cumulative + elapsed >= overall_time_limit: OVERALL_TIME_LIMIT_EXCEEDED
 * 5. peak RSS >= memory_limit or evidence of an allocation failure: MEMORY_LIMIT_EXCEEDED
 * 6. stdout/stderr truncated or killed by SIGXFSZ: OUTPUT_LIMIT_EXCEEDED
 * 7. non-zero return code: RUNTIME_ERROR
 * 8. SUCCESS
 * Time wins over memory when both limits are hit.
 */
execution_status classify(const classify_input &in, const resource_limits &limits);

/**
 * @brief Signal that terminated the command, derived from the 128 + N convention
 * @return the signal number, or nothing if the command exited normally
 */
std::optional<int> termination_signal(int return_code);

/**
 * @brief Human readable explanation of a status
 * @return nothing for SUCCESS
 */
std::optional<std::string> explain(execution_status status, const classify_input &in, const resource_limits &limits);

}  // namespace bubble
