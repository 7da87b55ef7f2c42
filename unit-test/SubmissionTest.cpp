#include "gtest/gtest.h"
#include "judge/listener.hpp"
#include "judge/submission.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;

class SubmissionTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
    }
};

TEST_F(SubmissionTest, StatusStringTest) {
    EXPECT_STREQ(get_status_string(status::SUCCESS), "success");
    EXPECT_STREQ(get_status_string(status::FAILURE), "failure");
    EXPECT_STREQ(get_status_string(status::ERROR), "error");
    EXPECT_STREQ(get_status_string(status::TIMEOUT), "timeout");
    EXPECT_EQ(parse_status("timeout"), status::TIMEOUT);
    EXPECT_THROW(parse_status("accepted"), invalid_argument);

    EXPECT_STREQ(get_reason_code(error_kind::NONE), "");
    EXPECT_STREQ(get_reason_code(error_kind::MEMORY_LIMIT_EXCEEDED), "memory_limit_exceeded");
    EXPECT_STREQ(get_state_name(submission_state::CLASSIFYING), "classifying");
}

TEST_F(SubmissionTest, RequestFromJsonTest) {
    submission_request request = nlohmann::json::parse(R"json({
        "code": "print(input())",
        "language": "py",
        "stdin": "hello",
        "problem_id": "two-sum",
        "time_limit_sec": 1.5
    })json").get<submission_request>();
    EXPECT_EQ(request.code, "print(input())");
    EXPECT_EQ(request.language, "py");
    EXPECT_EQ(request.stdin_data, "hello");
    EXPECT_EQ(request.problem_id.value_or(""), "two-sum");
    EXPECT_DOUBLE_EQ(request.time_limit_sec, 1.5);
    EXPECT_EQ(request.memory_limit_mb, -1);

    request = nlohmann::json::parse(R"({"code": "", "language": "ts", "problem_id": null})").get<submission_request>();
    EXPECT_FALSE(request.problem_id.has_value());

    EXPECT_THROW(nlohmann::json::parse(R"({"code": ""})").get<submission_request>(), nlohmann::json::exception);
}

TEST_F(SubmissionTest, GradedResultJsonTest) {
    execution_result result;
    result.execution_id = "id";
    result.stat = status::FAILURE;
    result.exit_code = 0;
    result.stdout_text = "out";
    result.execution_time_sec = 0.5;
    result.error_message = "1 of 2 tests failed";
    result.per_test = vector<test_result>{{0, "basic", true}, {1, nullopt, false}};
    result.memory_peak = 1024;

    EXPECT_JSON_EQ(nlohmann::json(result), nlohmann::json::parse(R"({
        "execution_id": "id",
        "status": "failure",
        "exit_code": 0,
        "stdout": "out",
        "stderr": "",
        "execution_time_sec": 0.5,
        "error_message": "1 of 2 tests failed",
        "error_kind": "",
        "memory_peak_bytes": 1024,
        "per_test": [
            { "index": 0, "name": "basic", "passed": true },
            { "index": 1, "passed": false }
        ]
    })"));
}

TEST_F(SubmissionTest, TranslationFailureJsonTest) {
    execution_result result;
    result.execution_id = "id";
    result.stat = status::ERROR;
    result.kind = error_kind::SIGNATURE_NOT_FOUND;
    result.error_message = "function two_sum is not defined";
    result.per_test = vector<test_result>();

    nlohmann::json j = result;
    EXPECT_TRUE(j.at("exit_code").is_null());
    EXPECT_EQ(j.at("error_kind"), "signature_not_found");
    EXPECT_JSON_EQ(j.at("per_test"), nlohmann::json::array());

    result.per_test.reset();
    EXPECT_EQ(nlohmann::json(result).count("per_test"), 0u);
}
