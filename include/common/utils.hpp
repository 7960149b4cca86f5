#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return formatter<std::string>::format(p.string(), ctx);
    }
};
}  // namespace fmt

namespace bubble {

/**
 * @brief Look up an environment variable
 * @param key name of the variable
 * @param def_value returned if the variable is not set
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief Render an argv as one shell-like line for logs and error messages
 * Arguments containing whitespace or quotes are single-quoted.
 */
std::string join_command(const std::vector<std::string> &argv);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief seconds since construction
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace bubble
