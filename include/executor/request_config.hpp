#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "sandbox/limits.hpp"
#include "sandbox/sandbox_config.hpp"

namespace bubble {

/**
 * @brief Settings read from a configuration file
 * @code{.json}
 * {
 *     "sandbox": {"workspace": "/var/lib/codebubble", "hostname": "sandbox"},
 *     "limits": {"time_limit": 2, "overall_time_limit": 10, "memory_limit": 262144},
 *     "language": {"language": "cpp", "flags": ["-std=c++17", "-O2"]}
 * }
 * @endcode
 */
struct request_config {
    sandbox_config sandbox;
    resource_limits limits;

    /**
     * @brief Passed to make_language, null if the file has no language section
     */
    nlohmann::json language;
};

/**
 * @brief Missing keys keep their default values
 */
void from_json(const nlohmann::json &j, resource_limits &limits);

void from_json(const nlohmann::json &j, request_config &config);

/**
 * @brief Parse a configuration document
 * @throw config_error if the document is malformed or a key has the wrong type
 */
request_config parse_request_config(const std::string &text);

/**
 * @brief Read and parse a configuration file
 * @throw config_error if the file can not be read or is malformed
 */
request_config load_request_config(const std::filesystem::path &path);

}  // namespace bubble
