#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bubble {

/**
 * @brief Resource usage of one run as reported by the measurement wrapper
 * Memory sizes are in KB, times in seconds.
 */
struct time_result {
    std::string command;

    /**
     * @brief Wall clock time of the measured command
     */
    double elapsed_time = 0;

    /**
     * @brief CPU time spent in user mode
     * All threads and waited-for children are accumulated
     */
    double user_cpu_time = 0;

    /**
     * @brief CPU time spent in kernel mode
     */
    double system_cpu_time = 0;

    /**
     * @brief (user + system) / elapsed, as printed by the wrapper, e.g. "99%"
     * "?%" when the elapsed time is too short to compute it
     */
    std::string cpu_percentage;

    int64_t avg_total_mem = 0;
    int64_t avg_shared_mem = 0;
    int64_t avg_unshared_data = 0;
    int64_t avg_unshared_stack = 0;

    /**
     * @brief Soft page faults (page reclaims)
     */
    int64_t page_reclaims = 0;

    /**
     * @brief Hard page faults
     */
    int64_t page_faults = 0;

    int64_t swaps = 0;
    int64_t block_input_ops = 0;
    int64_t block_output_ops = 0;
    int64_t ipc_msgs_sent = 0;
    int64_t ipc_msgs_received = 0;
    int64_t signals_received = 0;
    int64_t voluntary_ctxt_switches = 0;
    int64_t involuntary_ctxt_switches = 0;

    /**
     * @brief Peak resident set size
     */
    int64_t max_resident_set_size = 0;

    int exit_status = 0;
};

/**
 * @brief Format string handed to GNU time, one "Key: value" pair per line
 */
extern const char *TIME_FORMAT;

/**
 * @brief Parse the resource usage record written by the measurement wrapper
 * Lines that are not "Key: value" pairs of known keys are skipped, this covers
 * the "Command terminated by signal N" preamble GNU time prints.
 * @param text content of the record
 * @return the parsed result, or nothing if any numeric field is missing or malformed,
 * or if a key appears more than once
 */
std::optional<time_result> parse_time_result(const std::string &text);

/**
 * @brief Read and parse the record file
 * @return nothing if the file does not exist, which happens when the wrapper
 * was killed before it could write the record
 */
std::optional<time_result> read_time_result(const std::filesystem::path &path);

}  // namespace bubble
