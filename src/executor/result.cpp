#include "executor/result.hpp"

namespace bubble {
using namespace std;
using namespace nlohmann;

template <typename T>
static json optional_json(const optional<T> &value) {
    if (value) return json(*value);
    return json();
}

void to_json(json &j, const time_result &usage) {
    j = {{"command", usage.command},
         {"elapsed_time", usage.elapsed_time},
         {"user_cpu_time", usage.user_cpu_time},
         {"system_cpu_time", usage.system_cpu_time},
         {"cpu_percentage", usage.cpu_percentage},
         {"avg_total_mem", usage.avg_total_mem},
         {"avg_shared_mem", usage.avg_shared_mem},
         {"avg_unshared_data", usage.avg_unshared_data},
         {"avg_unshared_stack", usage.avg_unshared_stack},
         {"page_reclaims", usage.page_reclaims},
         {"page_faults", usage.page_faults},
         {"swaps", usage.swaps},
         {"block_input_ops", usage.block_input_ops},
         {"block_output_ops", usage.block_output_ops},
         {"ipc_msgs_sent", usage.ipc_msgs_sent},
         {"ipc_msgs_received", usage.ipc_msgs_received},
         {"signals_received", usage.signals_received},
         {"voluntary_ctxt_switches", usage.voluntary_ctxt_switches},
         {"involuntary_ctxt_switches", usage.involuntary_ctxt_switches},
         {"max_resident_set_size", usage.max_resident_set_size},
         {"exit_status", usage.exit_status}};
}

void to_json(json &j, const execution_result &result) {
    j = {{"command", result.command},
         {"status", status_name(result.status)},
         {"return_code", result.return_code},
         {"stdout", result.stdout_data},
         {"stderr", result.stderr_data},
         {"stdout_truncated", result.stdout_truncated},
         {"stderr_truncated", result.stderr_truncated},
         {"compile_time", optional_json(result.compile_time)},
         {"execution_time", optional_json(result.execution_time)},
         {"error", optional_json(result.error)},
         {"time_result", optional_json(result.usage)}};
}

}  // namespace bubble
