#pragma once

#include <string>
#include <vector>
#include "executor/language.hpp"
#include "executor/result.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/sandbox.hpp"

namespace bubble {

/**
 * @brief One piece of source code and the inputs to run it against
 */
struct execution_request {
    std::string source_code;
    std::vector<std::string> inputs;
    resource_limits limits;
};

/**
 * @brief Runs execution requests on one sandbox instance
 * Requests on the same pipeline (or on pipelines sharing the sandbox) are
 * serialized by the workspace lock, pipelines on distinct sandboxes run concurrently.
 */
struct execution_pipeline {
    execution_pipeline(sandbox &box, const language &lang);

    /**
     * @brief Run the request and collect one result per input, in input order
     * 1. Inputs larger than max_input_size get INPUT_LIMIT_EXCEEDED and are never run
     * 2. Reset the workspace and prepare the source code
     * 3. Compile if the language needs it, a failure marks every input COMPILE_ERROR
     * 4. For each input, reset the run directory and run it under the remaining
     *    overall budget, inputs after the budget ran out are not run
     * 5. Faults of the sandbox mark the faulting and all remaining inputs INTERNAL_ERROR
     * Never throws, every failure ends up in the results.
     */
    std::vector<execution_result> run(const execution_request &request);

private:
    execution_result run_input(const std::string &input, const std::vector<std::string> &command,
                               const resource_limits &limits, double &cumulative);

    sandbox &box;
    const language &lang;
};

}  // namespace bubble
