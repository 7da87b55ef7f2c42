#pragma once

#include <cstddef>
#include <string>
#include "common/status.hpp"
#include "sandbox/executor.hpp"

namespace grader {

/**
 * @brief 运行模式：简易运行或者带 test_count 个测试点的评测
 */
struct classify_mode {
    bool graded = false;
    std::size_t test_count = 0;

    static classify_mode bare();
    static classify_mode graded_with(std::size_t test_count);
};

/**
 * @brief 分类结果
 */
struct classification {
    status stat = status::ERROR;
    error_kind kind = error_kind::NONE;
    std::string error_message;

    /**
     * @brief 返回给调用方的输出，被截断时末尾附加 [... N bytes truncated]
     */
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @brief 根据原始结果判定最终状态
 * 这是一个纯函数，相同的输入一定得到相同的结果。优先级：
 * 1. 超时；
 * 2. 内存超限；
 * 3. 评测时有测试点失败；
 * 4. 评测时所有测试点都已报告通过且退出码为 0；
 * 5. 其余情况为运行错误。
 */
classification classify(const sandbox::raw_result &raw, const classify_mode &mode);

/**
 * @brief 返回最后一个非空行，去掉首尾空白
 */
std::string last_nonempty_line(const std::string &text);

}  // namespace grader
