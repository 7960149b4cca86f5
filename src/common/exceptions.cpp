#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace bubble {
using namespace std;

bubble_exception::bubble_exception()
    : bubble_exception("") {}

bubble_exception::bubble_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *bubble_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const bubble_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : bubble_exception() {}

internal_error::internal_error(const string &message)
    : bubble_exception(message) {}

sandbox_error::sandbox_error()
    : internal_error() {}

sandbox_error::sandbox_error(const string &message)
    : internal_error(message) {}

config_error::config_error()
    : bubble_exception() {}

config_error::config_error(const string &message)
    : bubble_exception(message) {}

}  // namespace bubble
