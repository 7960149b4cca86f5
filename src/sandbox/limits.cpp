#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace bubble {
using namespace std;

void resource_limits::validate() const {
    if (!(time_limit > 0))
        throw config_error(fmt::format("time_limit must be positive, got {}", time_limit));
    if (!(overall_time_limit > 0))
        throw config_error(fmt::format("overall_time_limit must be positive, got {}", overall_time_limit));
    if (memory_limit <= 0)
        throw config_error(fmt::format("memory_limit must be positive, got {}", memory_limit));
    if (max_input_size <= 0)
        throw config_error(fmt::format("max_input_size must be positive, got {}", max_input_size));
    if (max_output_size <= 0)
        throw config_error(fmt::format("max_output_size must be positive, got {}", max_output_size));
    if (overall_time_limit < time_limit)
        throw config_error(fmt::format("overall_time_limit ({}) must not be less than time_limit ({})", overall_time_limit, time_limit));
}

string resource_limits::to_string() const {
    return fmt::format("resource_limits(time_limit={}s, overall_time_limit={}s, memory_limit={}KB, max_input_size={}KB, max_output_size={}KB)",
                       time_limit, overall_time_limit, memory_limit, max_input_size, max_output_size);
}

}  // namespace bubble
