#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "sandbox/time_result.hpp"

namespace bubble {

/**
 * @brief Result of running the program against one input
 */
struct execution_result {
    /**
     * @brief Full command line that was executed, empty if nothing ran
     */
    std::string command;

    execution_status status = execution_status::INTERNAL_ERROR;

    /**
     * @brief -1 if nothing ran
     */
    int return_code = -1;

    /**
     * @brief At most max_output_size KB each
     */
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief Seconds spent compiling, for compiled languages only
     */
    std::optional<double> compile_time;

    /**
     * @brief Elapsed seconds of the run, absent if the input was not run
     */
    std::optional<double> execution_time;

    /**
     * @brief Explanation of a non-successful status, or the compiler output
     */
    std::optional<std::string> error;

    std::optional<time_result> usage;
};

void to_json(nlohmann::json &j, const time_result &usage);

/**
 * @brief Absent optional fields are written as null
 */
void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace bubble
