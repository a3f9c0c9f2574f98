#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception()
    : runner_exception("") {}

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

network_error::network_error()
    : runner_exception() {}

network_error::network_error(const string &message)
    : runner_exception(message) {}

timeout_error::timeout_error()
    : network_error() {}

timeout_error::timeout_error(const string &message)
    : network_error(message) {}

rejection_error::rejection_error()
    : runner_exception() {}

rejection_error::rejection_error(const string &message)
    : runner_exception(message) {}

unsupported_language_error::unsupported_language_error(const string &language)
    : rejection_error("Unsupported language"), language(language) {}

invalid_submission::invalid_submission(const string &message)
    : rejection_error(message) {}

protocol_error::protocol_error(long status_code, const string &body)
    : runner_exception(fmt::format("judge responded with HTTP {}", status_code)), status(status_code), response_body(body) {}

long protocol_error::status_code() const noexcept {
    return status;
}

const string &protocol_error::body() const noexcept {
    return response_body;
}

}  // namespace runner
