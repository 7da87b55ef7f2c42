#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace grader {

enum class visibility {
    PUBLIC,
    PRIVATE
};

/**
 * @brief 测试中的一行
 * SETUP 行原样输出到测试代码中（比如准备变量），ASSERTION 行是一条需要翻译的断言
 */
struct test_step {
    enum class kind { SETUP, ASSERTION };

    kind type = kind::ASSERTION;

    std::string source;

    /**
     * @brief 断言相对于测试代码块的缩进，比如写在 for 循环体中的断言
     */
    std::string indent;
};

/**
 * @brief 题目的一个测试点
 * 结构化写法：inputs 为实参表达式，expected 为期望返回值，评测时生成 f(inputs...) == expected；
 * 自由写法：steps 为 assert 断言与准备代码的混合。
 */
struct test_case {
    std::string name;

    /**
     * @brief 私有测试点在结果中只暴露序号和是否通过，不暴露名字与断言内容
     */
    visibility vis = visibility::PUBLIC;

    std::vector<std::string> inputs;

    std::optional<std::string> expected;

    std::vector<test_step> steps;

    bool structured() const;
};

/**
 * @brief 题目定义，加载后不再修改
 */
struct problem_spec {
    std::string id;

    std::string title;

    std::string difficulty;

    std::vector<std::string> category;

    std::string description;

    /**
     * @brief 运行时间上限，也是提交覆盖时间限制时的最大值，单位为秒
     */
    double time_limit_sec = 2.0;

    /**
     * @brief 内存上限（MB），也是提交覆盖内存限制时的最大值
     */
    int memory_limit_mb = 256;

    /**
     * @brief 规范函数签名，比如 def two_sum(nums: list[int], target: int) -> list[int]:
     */
    std::string function_signature;

    std::vector<test_case> tests;

    /**
     * @brief 题目支持的语言，默认只支持 python
     */
    std::vector<std::string> supported_languages = {"python"};

    std::optional<std::string> hint;

    std::optional<std::string> solution;

    bool supports(const std::string &language) const;
};

/**
 * @brief 将 pytest 风格的测试代码按 def test_xxx(): 拆分成多个测试点
 * 不属于任何测试函数的顶层代码（import、辅助函数）作为每个测试点的准备代码。
 * 没有测试函数时，整段代码作为一个名为 test 的测试点。
 * 以 assert 开头的行是断言，其余行是准备代码。
 * @param code 测试代码
 * @param vis 拆分出的测试点的可见性
 */
std::vector<test_case> split_test_code(const std::string &code, visibility vis = visibility::PUBLIC);

/**
 * @brief 将一段自由写法的测试代码拆成 steps，会去掉公共缩进
 */
std::vector<test_step> parse_test_steps(const std::string &code);

/**
 * @brief 从题库目录中读取题目 <problems_dir>/<id>.json
 * @throw invalid_request 若题目编号不合法或者题目不存在
 */
problem_spec load_problem(const std::filesystem::path &problems_dir, const std::string &id);

void from_json(const nlohmann::json &j, test_case &test);

void from_json(const nlohmann::json &j, problem_spec &problem);

}  // namespace grader
