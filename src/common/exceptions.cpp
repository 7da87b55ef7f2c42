#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

translation_error::translation_error(kind type, const string &message)
    : grader_exception(message), error_type(type) {}

translation_error::kind translation_error::type() const noexcept {
    return error_type;
}

const char *translation_error::reason() const noexcept {
    switch (error_type) {
        case kind::MALFORMED_SIGNATURE:
            return "malformed_signature";
        case kind::SIGNATURE_NOT_FOUND:
            return "signature_not_found";
        case kind::MALFORMED_TEST:
            return "malformed_test";
    }
    return "translation_error";
}

launch_error::launch_error()
    : grader_exception() {}

launch_error::launch_error(const string &message)
    : grader_exception(message) {}

system_busy::system_busy()
    : grader_exception() {}

system_busy::system_busy(const string &message)
    : grader_exception(message) {}

invalid_request::invalid_request()
    : grader_exception() {}

invalid_request::invalid_request(const string &message)
    : grader_exception(message) {}

}  // namespace grader
