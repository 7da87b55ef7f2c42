#include "judge/submission.hpp"

namespace grader {
using namespace std;

void from_json(const nlohmann::json &j, submission_request &request) {
    j.at("code").get_to(request.code);
    j.at("language").get_to(request.language);
    if (j.count("stdin") && j.at("stdin").is_string()) j.at("stdin").get_to(request.stdin_data);
    if (j.count("problem_id") && j.at("problem_id").is_string()) request.problem_id = j.at("problem_id").get<string>();
    if (j.count("time_limit_sec") && j.at("time_limit_sec").is_number()) j.at("time_limit_sec").get_to(request.time_limit_sec);
    if (j.count("memory_limit_mb") && j.at("memory_limit_mb").is_number()) j.at("memory_limit_mb").get_to(request.memory_limit_mb);
}

void to_json(nlohmann::json &j, const test_result &result) {
    j = {{"index", result.index}, {"passed", result.passed}};
    if (result.name) j["name"] = *result.name;
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"execution_id", result.execution_id},
         {"status", get_status_string(result.stat)},
         {"exit_code", nullptr},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"execution_time_sec", result.execution_time_sec},
         {"error_message", result.error_message},
         {"error_kind", get_reason_code(result.kind)},
         {"memory_peak_bytes", result.memory_peak}};
    if (result.exit_code) j["exit_code"] = *result.exit_code;
    if (result.per_test) j["per_test"] = *result.per_test;
}

}  // namespace grader
