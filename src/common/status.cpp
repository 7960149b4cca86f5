#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace bubble {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> status_display = boost::assign::map_list_of
    (execution_status::SUCCESS, "Success")
    (execution_status::COMPILE_ERROR, "Compile Error")
    (execution_status::RUNTIME_ERROR, "Runtime Error")
    (execution_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (execution_status::OVERALL_TIME_LIMIT_EXCEEDED, "Overall Time Limit Exceeded")
    (execution_status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (execution_status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (execution_status::INPUT_LIMIT_EXCEEDED, "Input Limit Exceeded")
    (execution_status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<execution_status, const char *> status_names = boost::assign::map_list_of
    (execution_status::SUCCESS, "SUCCESS")
    (execution_status::COMPILE_ERROR, "COMPILE_ERROR")
    (execution_status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (execution_status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (execution_status::OVERALL_TIME_LIMIT_EXCEEDED, "OVERALL_TIME_LIMIT_EXCEEDED")
    (execution_status::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED")
    (execution_status::OUTPUT_LIMIT_EXCEEDED, "OUTPUT_LIMIT_EXCEEDED")
    (execution_status::INPUT_LIMIT_EXCEEDED, "INPUT_LIMIT_EXCEEDED")
    (execution_status::INTERNAL_ERROR, "INTERNAL_ERROR");
// clang-format on

const char *get_display_message(execution_status stat) {
    return status_display.at(stat);
}

const char *status_name(execution_status stat) {
    return status_names.at(stat);
}

execution_status status_from_string(const string &name) {
    for (auto &[stat, str] : status_names)
        if (name == str) return stat;
    throw config_error("unknown execution status " + name);
}

}  // namespace bubble
