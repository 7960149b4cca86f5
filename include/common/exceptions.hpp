#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace bubble {

struct bubble_exception : std::exception {
    bubble_exception();
    explicit bubble_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const bubble_exception &ex);

    template <typename T>
    bubble_exception operator<<(const T &t) const {
        return bubble_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief Fault of the orchestration layer itself
 * For example the workspace cannot be written or a measurement file cannot be read.
 * The pipeline reports these as INTERNAL_ERROR.
 */
struct internal_error : public bubble_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief The isolation primitive or one of the wrapper tools could not be started
 * This is never caused by the untrusted program.
 */
struct sandbox_error : public internal_error {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief Malformed or inconsistent configuration
 * Raised by resource_limits::validate and the json loaders.
 */
struct config_error : public bubble_exception {
    config_error();
    explicit config_error(const std::string &message);
};

}  // namespace bubble
