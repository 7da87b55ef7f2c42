#include <algorithm>
#include <future>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/engine.hpp"
#include "test/environment.hpp"
#include "test/mock_executor.hpp"

using namespace std;
using namespace grader;
using namespace grader::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Not;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StartsWith;
using ::testing::Throw;

static const char *CORRECT_SOLUTION = R"(def two_sum(nums, target):
    seen = {}
    for i, n in enumerate(nums):
        if target - n in seen:
            return [seen[target - n], i]
        seen[n] = i
    return []
)";

class EngineTest : public ::testing::Test {
protected:
    static problem_spec two_sum() {
        return nlohmann::json::parse(R"({
            "id": "two-sum",
            "function_signature": "def two_sum(nums: list[int], target: int) -> list[int]:",
            "supported_languages": ["python", "typescript", "javascript"],
            "time_limit_sec": 2.0,
            "memory_limit_mb": 256,
            "tests": [
                { "name": "basic", "inputs": [[2, 7, 11, 15], 9], "expected": [0, 1] },
                { "name": "secret_case", "inputs": [[3, 3], 6], "expected": [0, 1], "visibility": "private" }
            ]
        })").get<problem_spec>();
    }

    static submission_request python(const string &code) {
        submission_request request;
        request.code = code;
        request.language = "python";
        return request;
    }

    /**
     * @brief 使用 mock 执行器创建引擎，executor 指向引擎持有的执行器
     */
    unique_ptr<engine> mocked_engine(engine_config config = test_config()) {
        auto runner = make_unique<mock_executor>();
        executor = runner.get();
        auto result = make_unique<engine>(config, translate::language_registry(), move(runner));
        result->register_listener(make_unique<recording_listener>(rec));
        return result;
    }

    vector<submission_state> states_of(const string &execution_id) {
        scoped_lock guard(rec->mut);
        vector<submission_state> result;
        for (auto &[id, state] : rec->states)
            if (id == execution_id) result.push_back(state);
        return result;
    }

    mock_executor *executor = nullptr;
    shared_ptr<recording_listener::record> rec = make_shared<recording_listener::record>();
};

TEST_F(EngineTest, GradedSuccessTest) {
    auto eng = mocked_engine();
    EXPECT_CALL(*executor, execute(_)).WillOnce(Return(passing_result(2)));

    execution_result result = eng->run_graded(python(CORRECT_SOLUTION), two_sum());
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.kind, error_kind::NONE);
    EXPECT_EQ(result.exit_code.value_or(-1), 0);
    ASSERT_TRUE(result.per_test.has_value());
    ASSERT_EQ(result.per_test->size(), 2u);
    EXPECT_EQ((*result.per_test)[0].name, "basic");
    EXPECT_TRUE((*result.per_test)[0].passed);
    EXPECT_FALSE((*result.per_test)[1].name.has_value());
    EXPECT_EQ((*result.per_test)[1].index, 1u);

    EXPECT_EQ(states_of(result.execution_id),
              vector<submission_state>({submission_state::QUEUED, submission_state::TRANSLATING,
                                        submission_state::EXECUTING, submission_state::CLASSIFYING,
                                        submission_state::COMPLETED}));
    ASSERT_EQ(rec->results.size(), 1u);
    EXPECT_EQ(rec->results[0].execution_id, result.execution_id);
}

TEST_F(EngineTest, GradedFailureTest) {
    auto eng = mocked_engine();
    EXPECT_CALL(*executor, execute(_)).WillOnce(Return(passing_result(2, false)));

    execution_result result = eng->run_graded(python(CORRECT_SOLUTION), two_sum());
    EXPECT_EQ(result.stat, status::FAILURE);
    EXPECT_EQ(result.error_message, "1 of 2 tests failed");
    ASSERT_EQ(result.per_test->size(), 2u);
    EXPECT_FALSE((*result.per_test)[1].passed);

    // 私有测试点的名字不能出现在返回给调用方的结果中
    EXPECT_THAT(nlohmann::json(result).dump(), Not(HasSubstr("secret_case")));
}

TEST_F(EngineTest, HarnessRequestTest) {
    auto eng = mocked_engine();
    sandbox::execution_request captured;
    EXPECT_CALL(*executor, execute(_)).WillOnce(DoAll(SaveArg<0>(&captured), Return(passing_result(2))));

    submission_request request = python(CORRECT_SOLUTION);
    request.stdin_data = "input";
    eng->run_graded(request, two_sum());

    EXPECT_EQ(captured.source_file, "main.py");
    EXPECT_EQ(captured.command, vector<string>({"python3", "{{source}}"}));
    EXPECT_EQ(captured.stdin_data, "input");
    EXPECT_THAT(captured.marker_delimiter, StartsWith("@@GRADER:"));
    EXPECT_THAT(captured.source, StartsWith(CORRECT_SOLUTION));
    EXPECT_THAT(captured.source, HasSubstr(captured.marker_delimiter));
}

TEST_F(EngineTest, GradedLimitTest) {
    auto eng = mocked_engine();
    sandbox::execution_request first, second;
    EXPECT_CALL(*executor, execute(_))
        .WillOnce(DoAll(SaveArg<0>(&first), Return(passing_result(2))))
        .WillOnce(DoAll(SaveArg<0>(&second), Return(passing_result(2))));

    // 提交不能放宽题目的限制
    submission_request request = python(CORRECT_SOLUTION);
    request.time_limit_sec = 30;
    request.memory_limit_mb = 4096;
    eng->run_graded(request, two_sum());
    EXPECT_DOUBLE_EQ(first.time_limit, 2.0);
    EXPECT_EQ(first.memory_limit, 256);

    request.time_limit_sec = 0.5;
    request.memory_limit_mb = 64;
    eng->run_graded(request, two_sum());
    EXPECT_DOUBLE_EQ(second.time_limit, 0.5);
    EXPECT_EQ(second.memory_limit, 64);
}

TEST_F(EngineTest, BareLimitTest) {
    auto eng = mocked_engine();
    sandbox::execution_request first, second;
    EXPECT_CALL(*executor, execute(_))
        .WillOnce(DoAll(SaveArg<0>(&first), Return(passing_result(0))))
        .WillOnce(DoAll(SaveArg<0>(&second), Return(passing_result(0))));

    eng->run_bare(python("print(1)"));
    EXPECT_DOUBLE_EQ(first.time_limit, 2.0);
    EXPECT_EQ(first.memory_limit, 256);
    EXPECT_EQ(first.marker_delimiter, "");

    submission_request request = python("print(1)");
    request.time_limit_sec = 30;
    request.memory_limit_mb = 4096;
    eng->run_bare(request);
    EXPECT_DOUBLE_EQ(second.time_limit, 10.0);
    EXPECT_EQ(second.memory_limit, 1024);

    EXPECT_DOUBLE_EQ(effective_time_limit(-1, 2.0, 10.0), 2.0);
    EXPECT_DOUBLE_EQ(effective_time_limit(5.0, 2.0, 3.0), 3.0);
    EXPECT_EQ(effective_memory_limit(0, 256, 1024), 256);
}

TEST_F(EngineTest, BareRunTest) {
    auto eng = mocked_engine();
    sandbox::raw_result raw = passing_result(0);
    raw.stdout_text = "hello\n";
    EXPECT_CALL(*executor, execute(_)).WillOnce(Return(raw));

    execution_result result = eng->run_bare(python("print('hello')"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_FALSE(result.per_test.has_value());
    EXPECT_EQ(states_of(result.execution_id),
              vector<submission_state>({submission_state::QUEUED, submission_state::EXECUTING,
                                        submission_state::CLASSIFYING, submission_state::COMPLETED}));
}

TEST_F(EngineTest, TranslationErrorTest) {
    auto eng = mocked_engine();
    EXPECT_CALL(*executor, execute(_)).Times(0);

    execution_result result = eng->run_graded(python("def other(x):\n    return x\n"), two_sum());
    EXPECT_EQ(result.stat, status::ERROR);
    EXPECT_EQ(result.kind, error_kind::SIGNATURE_NOT_FOUND);
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.per_test.has_value());
    EXPECT_TRUE(result.per_test->empty());
    EXPECT_EQ(states_of(result.execution_id),
              vector<submission_state>({submission_state::QUEUED, submission_state::TRANSLATING,
                                        submission_state::FAILED}));
    EXPECT_EQ(rec->results.size(), 1u);
}

TEST_F(EngineTest, LaunchErrorTest) {
    auto eng = mocked_engine();
    EXPECT_CALL(*executor, execute(_)).WillOnce(Throw(launch_error("interpreter python3 is not installed")));

    execution_result result = eng->run_bare(python("print(1)"));
    EXPECT_EQ(result.stat, status::ERROR);
    EXPECT_EQ(result.kind, error_kind::LAUNCH_ERROR);
    EXPECT_EQ(result.error_message, "launch_error: interpreter python3 is not installed");
    EXPECT_EQ(states_of(result.execution_id).back(), submission_state::FAILED);
    EXPECT_EQ(rec->results.size(), 1u);
}

TEST_F(EngineTest, InvalidRequestTest) {
    auto eng = mocked_engine();
    EXPECT_CALL(*executor, execute(_)).Times(0);

    submission_request request = python("print(1)");
    request.language = "cobol";
    EXPECT_THROW(eng->run_bare(request), invalid_request);

    problem_spec problem = two_sum();
    problem.supported_languages = {"python"};
    request.language = "ts";
    EXPECT_THROW(eng->run_graded(request, problem), invalid_request);

    EXPECT_THROW(eng->submit_graded(python(CORRECT_SOLUTION), nullptr), invalid_request);

    // 别名与题目中的语言名等价
    request.language = "py";
    request.code = CORRECT_SOLUTION;
    EXPECT_CALL(*executor, execute(_)).WillOnce(Return(passing_result(2)));
    EXPECT_EQ(eng->run_graded(request, problem).stat, status::SUCCESS);
    EXPECT_EQ(eng->stats().accepted, 1u);
}

TEST_F(EngineTest, SystemBusyTest) {
    engine_config config = test_config();
    config.workers = 2;
    config.queue_capacity = 8;
    auto eng = mocked_engine(config);

    promise<void> gate;
    shared_future<void> opened = gate.get_future().share();
    EXPECT_CALL(*executor, execute(_)).Times(10).WillRepeatedly(Invoke([opened](const sandbox::execution_request &) {
        opened.wait();
        return passing_result(0);
    }));

    vector<future<execution_result>> accepted;
    size_t rejected = 0;
    for (int i = 0; i < 50; ++i) {
        try {
            accepted.push_back(eng->submit_bare(python("print(1)")));
        } catch (system_busy &) {
            ++rejected;
        }
    }
    EXPECT_EQ(accepted.size(), 10u);
    EXPECT_EQ(rejected, 40u);
    EXPECT_EQ(eng->stats().rejected, 40u);

    gate.set_value();
    for (auto &result : accepted)
        EXPECT_EQ(result.get().stat, status::SUCCESS);

    scoped_lock guard(rec->mut);
    EXPECT_EQ(count_if(rec->states.begin(), rec->states.end(),
                       [](auto &item) { return item.second == submission_state::REJECTED; }),
              40);
    EXPECT_EQ(rec->results.size(), 10u);
}

TEST_F(EngineTest, SequentialSubmitTest) {
    engine_config config = test_config();
    config.workers = 1;
    config.queue_capacity = 0;
    auto eng = mocked_engine(config);
    EXPECT_CALL(*executor, execute(_)).Times(100).WillRepeatedly(Return(passing_result(0)));

    // 拿到结果时上一次运行的名额已经释放
    for (int i = 0; i < 100; ++i) {
        ASSERT_NO_THROW(EXPECT_EQ(eng->run_bare(python("print(1)")).stat, status::SUCCESS)) << "run " << i;
        EXPECT_EQ(eng->stats().in_flight, 0u);
    }
    EXPECT_EQ(eng->stats().rejected, 0u);
    EXPECT_EQ(eng->stats().completed, 100u);
}

TEST_F(EngineTest, EmptyProblemTest) {
    auto eng = mocked_engine();
    EXPECT_CALL(*executor, execute(_)).Times(0);

    problem_spec problem = two_sum();
    problem.tests.clear();
    EXPECT_THROW(eng->run_graded(python(CORRECT_SOLUTION), problem), invalid_request);
    EXPECT_EQ(eng->stats().accepted, 0u);
    EXPECT_TRUE(rec->results.empty());
}

TEST_F(EngineTest, SourceLimitTest) {
    engine_config config = test_config();
    config.source_limit_kb = 1;
    auto eng = mocked_engine(config);
    EXPECT_CALL(*executor, execute(_)).WillOnce(Return(passing_result(0)));

    EXPECT_THROW(eng->run_bare(python("# " + string(1024, 'x'))), invalid_request);
    EXPECT_THROW(eng->run_graded(python(CORRECT_SOLUTION + string(1024, '\n')), two_sum()), invalid_request);
    EXPECT_EQ(eng->run_bare(python(string(1022, '#') + "\n")).stat, status::SUCCESS);
    EXPECT_EQ(eng->stats().accepted, 1u);
}

TEST_F(EngineTest, LongUnterminatedSignatureTest) {
    engine_config config = test_config();
    config.source_limit_kb = 4096;
    auto eng = mocked_engine(config);
    EXPECT_CALL(*executor, execute(_)).Times(0);

    execution_result result = eng->run_graded(python("def f(" + string(1 << 20, 'a')), two_sum());
    EXPECT_EQ(result.stat, status::ERROR);
    EXPECT_EQ(result.kind, error_kind::SIGNATURE_NOT_FOUND);
}

/**
 * 以下测试真正运行 python3 程序
 */
class PythonEngineTest : public EngineTest {
protected:
    void SetUp() override {
        if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";
        eng = make_unique<engine>(test_config(), translate::language_registry(),
                                  make_unique<sandbox::process_executor>(test_context()));
    }

    unique_ptr<engine> eng;
};

TEST_F(PythonEngineTest, AllTestsPassTest) {
    execution_result result = eng->run_graded(python(string("print('debug')\n") + CORRECT_SOLUTION), two_sum());
    EXPECT_EQ(result.stat, status::SUCCESS) << result.stderr_text;
    EXPECT_EQ(result.exit_code.value_or(-1), 0);
    EXPECT_EQ(result.stdout_text, "debug\n");
    ASSERT_EQ(result.per_test->size(), 2u);
    EXPECT_TRUE((*result.per_test)[0].passed);
    EXPECT_TRUE((*result.per_test)[1].passed);
}

TEST_F(PythonEngineTest, WrongAnswerTest) {
    execution_result result = eng->run_graded(python("def two_sum(nums, target):\n    return [0, 0]\n"), two_sum());
    EXPECT_EQ(result.stat, status::FAILURE) << result.stderr_text;
    EXPECT_EQ(result.error_message, "2 of 2 tests failed");
    ASSERT_EQ(result.per_test->size(), 2u);
    EXPECT_FALSE((*result.per_test)[0].passed);
}

TEST_F(PythonEngineTest, InfiniteLoopTest) {
    submission_request request = python("def two_sum(nums, target):\n    while True:\n        pass\n");
    request.time_limit_sec = 1.0;
    execution_result result = eng->run_graded(request, two_sum());
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_EQ(result.kind, error_kind::TIME_LIMIT_EXCEEDED);
    EXPECT_GE(result.execution_time_sec, 1.0);
    EXPECT_LT(result.execution_time_sec, 1.5);
}

TEST_F(PythonEngineTest, SyntaxErrorTest) {
    execution_result result = eng->run_graded(python("def two_sum(nums, target):\n    return [\n"), two_sum());
    EXPECT_EQ(result.stat, status::ERROR);
    EXPECT_EQ(result.kind, error_kind::RUNTIME_FAULT);
    EXPECT_THAT(result.error_message, HasSubstr("SyntaxError"));
    ASSERT_TRUE(result.per_test.has_value());
    EXPECT_TRUE(result.per_test->empty());
}

TEST_F(PythonEngineTest, BareRunTest) {
    submission_request request = python("import sys\nprint(sys.stdin.read().upper())\n");
    request.stdin_data = "hello";
    execution_result result = eng->run_bare(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_text, "HELLO\n");

    result = eng->run_bare(python("print(1 / 0)\n"));
    EXPECT_EQ(result.stat, status::ERROR);
    EXPECT_EQ(result.kind, error_kind::RUNTIME_FAULT);
    EXPECT_EQ(result.exit_code.value_or(-1), 1);
    EXPECT_EQ(result.error_message, "ZeroDivisionError: division by zero");
}

class PairSumTest : public PythonEngineTest {
protected:
    static problem_spec pair_sum() {
        return nlohmann::json::parse(R"({
            "id": "pair-sum",
            "function_signature": "solve(nums, target) -> bool",
            "tests": [
                { "name": "example", "code": "assert solve([2,7,11,15], 9) == true" }
            ]
        })").get<problem_spec>();
    }
};

TEST_F(PairSumTest, CorrectSolutionTest) {
    execution_result result = eng->run_graded(python(R"(def solve(nums, target):
    seen = set()
    for n in nums:
        if target - n in seen:
            return True
        seen.add(n)
    return False
)"), pair_sum());
    EXPECT_EQ(result.stat, status::SUCCESS) << result.stderr_text;
    ASSERT_TRUE(result.per_test.has_value());
    ASSERT_EQ(result.per_test->size(), 1u);
    EXPECT_EQ((*result.per_test)[0].index, 0u);
    EXPECT_EQ((*result.per_test)[0].name.value_or(""), "example");
    EXPECT_TRUE((*result.per_test)[0].passed);
}

TEST_F(PairSumTest, AlwaysFalseTest) {
    execution_result result = eng->run_graded(python("def solve(nums, target):\n    return False\n"), pair_sum());
    EXPECT_EQ(result.stat, status::FAILURE) << result.stderr_text;
    ASSERT_TRUE(result.per_test.has_value());
    ASSERT_EQ(result.per_test->size(), 1u);
    EXPECT_EQ((*result.per_test)[0].name.value_or(""), "example");
    EXPECT_FALSE((*result.per_test)[0].passed);
}
