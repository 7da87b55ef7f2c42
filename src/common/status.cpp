#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_display = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::FAILURE, "Failure")
    (status::ERROR, "Error")
    (status::TIMEOUT, "Timeout");

static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::FAILURE, "failure")
    (status::ERROR, "error")
    (status::TIMEOUT, "timeout");

static const unordered_map<error_kind, const char *> reason_code = boost::assign::map_list_of
    (error_kind::NONE, "")
    (error_kind::MALFORMED_SIGNATURE, "malformed_signature")
    (error_kind::SIGNATURE_NOT_FOUND, "signature_not_found")
    (error_kind::MALFORMED_TEST, "malformed_test")
    (error_kind::LAUNCH_ERROR, "launch_error")
    (error_kind::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (error_kind::RUNTIME_FAULT, "runtime_fault")
    (error_kind::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded");
// clang-format on

const char *get_display_message(status stat) {
    return status_display.at(stat);
}

const char *get_status_string(status stat) {
    return status_string.at(stat);
}

status parse_status(const string &text) {
    for (auto &[stat, str] : status_string)
        if (text == str) return stat;
    throw invalid_argument("unknown status " + text);
}

const char *get_reason_code(error_kind kind) {
    return reason_code.at(kind);
}

}  // namespace grader
