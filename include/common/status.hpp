#pragma once

#include <string>

namespace bubble {

/**
 * @brief Outcome of running the program against one input
 * Exactly one status is assigned to every execution_result, see classify()
 * for the priority order.
 */
enum class execution_status {
    /**
     * @brief The program exited with code 0 within every limit
     */
    SUCCESS = 0,

    /**
     * @brief The source could not be compiled
     * Request-fatal: every input of the request gets this status and none is run.
     */
    COMPILE_ERROR = 1,

    /**
     * @brief Non-zero exit code or termination by a signal
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief The run was killed by the wall-clock guard, or its elapsed time
     * reached the per-input time limit
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief The cumulative elapsed time of the request reached overall_time_limit
     * The input was skipped, or aborted when the remaining budget ran out.
     */
    OVERALL_TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief Peak resident set size reached the memory limit, or the program
     * died of an allocation failure
     * The address space limit makes malloc return NULL (or new throw bad_alloc)
     * instead of letting the kernel kill the process, so the allocation failure
     * messages of the runtimes are taken as evidence too.
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief stdout or stderr was truncated at max_output_size, or the file-size
     * limit was hit
     */
    OUTPUT_LIMIT_EXCEEDED = 6,

    /**
     * @brief The input is larger than max_input_size, the program was not run
     */
    INPUT_LIMIT_EXCEEDED = 7,

    /**
     * @brief The sandbox itself failed
     * For example bwrap could not be started or the workspace is not writable.
     */
    INTERNAL_ERROR = 8
};

/**
 * @brief Human readable name, e.g. "Time Limit Exceeded"
 */
const char *get_display_message(execution_status);

/**
 * @brief Stable identifier used in json, e.g. "TIME_LIMIT_EXCEEDED"
 */
const char *status_name(execution_status);

/**
 * @brief Inverse of status_name
 * @throw config_error for unknown names
 */
execution_status status_from_string(const std::string &name);

}  // namespace bubble
