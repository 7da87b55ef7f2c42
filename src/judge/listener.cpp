#include "judge/listener.hpp"
#include <boost/assign.hpp>
#include <map>

namespace grader {
using namespace std;

// clang-format off
static const map<submission_state, const char *> state_names = boost::assign::map_list_of
    (submission_state::QUEUED, "queued")
    (submission_state::TRANSLATING, "translating")
    (submission_state::EXECUTING, "executing")
    (submission_state::CLASSIFYING, "classifying")
    (submission_state::COMPLETED, "completed")
    (submission_state::FAILED, "failed")
    (submission_state::REJECTED, "rejected");
// clang-format on

const char *get_state_name(submission_state state) {
    return state_names.at(state);
}

execution_listener::~execution_listener() {
}

void execution_listener::state_changed(const string &, submission_state) {
}

void execution_listener::completed(const submission_request &, const execution_result &) {
}

}  // namespace grader
