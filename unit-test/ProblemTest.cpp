#include <filesystem>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/problem.hpp"

using namespace std;
using namespace grader;

class ProblemTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        filesystem::create_directories(problems_dir);
    }

    static void TearDownTestCase() {
        filesystem::remove_all(problems_dir);
    }

    static filesystem::path problems_dir;
};

filesystem::path ProblemTest::problems_dir = "/tmp/grader-test/problems";

TEST_F(ProblemTest, StructuredTestsTest) {
    problem_spec problem = nlohmann::json::parse(R"({
        "id": "two-sum",
        "function_signature": "def two_sum(nums: list[int], target: int) -> list[int]:",
        "tests": [
            { "name": "basic", "inputs": [[2, 7, 11, 15], 9], "expected": [0, 1] },
            { "inputs": ["[3, 3]", 6], "expected": "[0, 1]", "visibility": "private" },
            { "inputs": [[1], 1], "expected": null, "hidden": true }
        ]
    })").get<problem_spec>();

    EXPECT_EQ(problem.id, "two-sum");
    EXPECT_DOUBLE_EQ(problem.time_limit_sec, 2.0);
    EXPECT_EQ(problem.memory_limit_mb, 256);
    EXPECT_EQ(problem.supported_languages, vector<string>({"python"}));
    ASSERT_EQ(problem.tests.size(), 3u);

    EXPECT_EQ(problem.tests[0].name, "basic");
    EXPECT_EQ(problem.tests[0].vis, visibility::PUBLIC);
    EXPECT_EQ(problem.tests[0].inputs, vector<string>({"[2,7,11,15]", "9"}));
    EXPECT_EQ(problem.tests[0].expected, "[0,1]");

    EXPECT_EQ(problem.tests[1].name, "test_2");
    EXPECT_EQ(problem.tests[1].vis, visibility::PRIVATE);
    EXPECT_EQ(problem.tests[1].inputs[0], "[3, 3]");
    EXPECT_EQ(problem.tests[1].expected, "[0, 1]");

    EXPECT_EQ(problem.tests[2].vis, visibility::PRIVATE);
    EXPECT_EQ(problem.tests[2].expected, "null");
}

TEST_F(ProblemTest, MissingExpectedTest) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "function_signature": "def f(x):",
        "tests": [{ "name": "broken", "inputs": [1] }]
    })");
    try {
        j.get<problem_spec>();
        FAIL() << "test without expected value should be rejected";
    } catch (translation_error &ex) {
        EXPECT_EQ(ex.type(), translation_error::kind::MALFORMED_TEST);
    }
}

TEST_F(ProblemTest, NonPositiveLimitsTest) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "id": "f",
        "function_signature": "def f(x):",
        "tests": [{ "inputs": [1], "expected": 1 }]
    })");
    EXPECT_NO_THROW(j.get<problem_spec>());

    for (double limit : {0.0, -1.0}) {
        nlohmann::json broken = j;
        broken["time_limit_sec"] = limit;
        EXPECT_THROW(broken.get<problem_spec>(), invalid_request) << limit;
    }
    for (int limit : {0, -256}) {
        nlohmann::json broken = j;
        broken["memory_limit_mb"] = limit;
        EXPECT_THROW(broken.get<problem_spec>(), invalid_request) << limit;
    }
}

TEST_F(ProblemTest, SplitTestCodeTest) {
    auto tests = split_test_code(R"(import pytest
from solution import two_sum

nums = [2, 7, 11, 15]

def test_basic():
    assert two_sum(nums, 9) == [0, 1]

@pytest.mark.slow
def test_loop():
    # 遍历所有的目标值
    for i in range(3):
        result = two_sum([i, 10], i + 10)
        assert result == [0, 1]
)",
                                 visibility::PRIVATE);

    ASSERT_EQ(tests.size(), 2u);
    EXPECT_EQ(tests[0].name, "test_basic");
    EXPECT_EQ(tests[0].vis, visibility::PRIVATE);
    ASSERT_EQ(tests[0].steps.size(), 2u);
    EXPECT_EQ(tests[0].steps[0].type, test_step::kind::SETUP);
    EXPECT_EQ(tests[0].steps[0].source, "nums = [2, 7, 11, 15]");
    EXPECT_EQ(tests[0].steps[1].type, test_step::kind::ASSERTION);
    EXPECT_EQ(tests[0].steps[1].source, "assert two_sum(nums, 9) == [0, 1]");

    EXPECT_EQ(tests[1].name, "test_loop");
    ASSERT_EQ(tests[1].steps.size(), 4u);
    EXPECT_EQ(tests[1].steps[1].source, "for i in range(3):");
    EXPECT_EQ(tests[1].steps[2].source, "    result = two_sum([i, 10], i + 10)");
    EXPECT_EQ(tests[1].steps[3].type, test_step::kind::ASSERTION);
    EXPECT_EQ(tests[1].steps[3].source, "assert result == [0, 1]");
    EXPECT_EQ(tests[1].steps[3].indent, "    ");
}

TEST_F(ProblemTest, SplitBareAssertionsTest) {
    auto tests = split_test_code("assert f(1) == 1\nassert f(2) == 4\n");
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests[0].name, "test");
    EXPECT_EQ(tests[0].steps.size(), 2u);

    EXPECT_TRUE(split_test_code("  \n").empty());
}

TEST_F(ProblemTest, LegacyTestCodeTest) {
    problem_spec problem = nlohmann::json::parse(R"({
        "function_signature": "def double(x: int) -> int:",
        "tests": [{ "inputs": [1], "expected": 2 }],
        "test_code": "def test_zero():\n    assert double(0) == 0\n",
        "supported_languages": ["python", "ts"],
        "hint": "multiply by two"
    })").get<problem_spec>();

    ASSERT_EQ(problem.tests.size(), 2u);
    EXPECT_EQ(problem.tests[0].name, "test_1");
    EXPECT_EQ(problem.tests[1].name, "test_zero");
    EXPECT_TRUE(problem.supports("ts"));
    EXPECT_FALSE(problem.supports("javascript"));
    EXPECT_EQ(problem.hint, "multiply by two");
    EXPECT_FALSE(problem.solution.has_value());
}

TEST_F(ProblemTest, LoadProblemTest) {
    write_file_content(problems_dir / "double.json", R"({
        "title": "Double",
        "function_signature": "def double(x: int) -> int:",
        "tests": [{ "inputs": [1], "expected": 2 }]
    })");

    problem_spec problem = load_problem(problems_dir, "double");
    EXPECT_EQ(problem.id, "double");
    EXPECT_EQ(problem.title, "Double");

    EXPECT_THROW(load_problem(problems_dir, "missing"), invalid_request);
    EXPECT_THROW(load_problem(problems_dir, "../double"), invalid_request);
}
