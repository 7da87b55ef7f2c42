#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 调用方发来的一次运行请求
 */
struct submission_request {
    std::string code;

    /**
     * @brief 语言名或别名，比如 python、ts
     */
    std::string language;

    std::string stdin_data;

    /**
     * @brief 评测时对应的题目编号，简易运行时为空
     */
    std::optional<std::string> problem_id;

    /**
     * @brief 覆盖题目的时间限制（秒），不会超过题目或者评测服务的上限，非正数表示不覆盖
     */
    double time_limit_sec = -1;

    /**
     * @brief 覆盖题目的内存限制（MB），不会超过题目或者评测服务的上限，非正数表示不覆盖
     */
    int memory_limit_mb = -1;
};

/**
 * @brief 单个测试点的结果
 * 私有测试点的名字为空，返回给调用方时也不会包含 name 字段
 */
struct test_result {
    std::size_t index = 0;
    std::optional<std::string> name;
    bool passed = false;
};

/**
 * @brief 返回给调用方的运行结果
 */
struct execution_result {
    std::string execution_id;

    status stat = status::ERROR;

    /**
     * @brief 选手程序的退出码，程序没有运行时（比如题目翻译失败）为空
     */
    std::optional<int> exit_code;

    std::string stdout_text;

    std::string stderr_text;

    double execution_time_sec = 0;

    std::string error_message;

    error_kind kind = error_kind::NONE;

    /**
     * @brief 评测时每个测试点的结果，简易运行时为空
     */
    std::optional<std::vector<test_result>> per_test;

    /**
     * @brief 采样得到的内存峰值，单位为字节
     */
    long long memory_peak = 0;
};

void from_json(const nlohmann::json &j, submission_request &request);

void to_json(nlohmann::json &j, const test_result &result);

void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace grader
