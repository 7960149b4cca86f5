#include "executor/request_config.hpp"
#include <fmt/format.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace bubble {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, resource_limits &limits) {
    if (j.count("time_limit"))
        j.at("time_limit").get_to(limits.time_limit);
    if (j.count("overall_time_limit"))
        j.at("overall_time_limit").get_to(limits.overall_time_limit);
    if (j.count("memory_limit"))
        j.at("memory_limit").get_to(limits.memory_limit);
    if (j.count("max_input_size"))
        j.at("max_input_size").get_to(limits.max_input_size);
    if (j.count("max_output_size"))
        j.at("max_output_size").get_to(limits.max_output_size);
}

void from_json(const json &j, request_config &config) {
    if (j.count("sandbox"))
        j.at("sandbox").get_to(config.sandbox);
    if (j.count("limits"))
        j.at("limits").get_to(config.limits);
    if (j.count("language"))
        config.language = j.at("language");
}

request_config parse_request_config(const string &text) {
    try {
        return json::parse(text).get<request_config>();
    } catch (json::exception &ex) {
        throw config_error(fmt::format("malformed configuration: {}", ex.what()));
    }
}

request_config load_request_config(const filesystem::path &path) {
    string text;
    try {
        text = read_file_content(path);
    } catch (system_error &ex) {
        throw config_error(fmt::format("unable to read configuration {}: {}", path, ex.what()));
    }
    return parse_request_config(text);
}

}  // namespace bubble
