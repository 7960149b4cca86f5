#pragma once

#include <cstdint>
#include <string>

namespace bubble {

/**
 * @brief Limits of one execution request
 */
struct resource_limits {
    /**
     * @brief Maximum wall clock seconds of the run for a single input
     */
    double time_limit = 5;

    /**
     * @brief Maximum cumulative wall clock seconds over all inputs of the request
     */
    double overall_time_limit = 30;

    /**
     * @brief Maximum memory in KB, enforced as address space limit and checked against peak RSS
     */
    int64_t memory_limit = 256 * 1024;

    /**
     * @brief Maximum size of one input in KB
     */
    int64_t max_input_size = 2 * 1024;

    /**
     * @brief Maximum size of stdout and of stderr in KB, also the base of the file size limit
     */
    int64_t max_output_size = 2 * 1024;

    /**
     * @brief Check that every value is positive and overall_time_limit >= time_limit
     * @throw config_error describing the first violated constraint
     */
    void validate() const;

    std::string to_string() const;
};

}  // namespace bubble
