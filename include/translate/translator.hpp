#pragma once

#include <map>
#include <string>
#include "judge/problem.hpp"
#include "translate/language.hpp"
#include "translate/signature.hpp"

namespace grader::translate {

/**
 * @brief 选手函数绑定的固定别名，测试代码只通过该别名调用选手函数
 */
extern const char *const ENTRY_ALIAS;

/**
 * @brief 拼接后可直接运行的测试程序
 */
struct harness_source {
    /**
     * @brief 完整的程序源码：选手代码、绑定代码、测试代码、结果上报
     */
    std::string code;

    /**
     * @brief 附加文件，文件名到内容
     */
    std::map<std::string, std::string> extra_files;

    /**
     * @brief 测试结果标记的前缀，形如 @@GRADER:<nonce>@@
     * 每个测试点输出一行 "<delimiter> <index> PASS|FAIL"
     */
    std::string delimiter;

    /**
     * @brief 测试点个数
     */
    std::size_t test_count = 0;

    /**
     * @brief 被绑定到别名的选手函数名
     */
    std::string entry_function;
};

/**
 * @brief 在选手代码中查找与签名对应的函数
 * 优先查找与签名同名的函数；找不到时选择第一个参数个数相同的顶层函数。
 * @return 找到的函数名
 * @throw translation_error(SIGNATURE_NOT_FOUND) 若找不到
 */
std::string locate_function(const function_signature &signature, const language_profile &language,
                            const std::string &code);

/**
 * @brief 将题目的测试翻译成目标语言，并与选手代码拼接成测试程序
 * @param nonce 测试结果标记中的随机串，防止选手代码伪造测试结果
 * @throw translation_error 若签名、测试无法翻译，或者选手代码中找不到对应函数
 */
harness_source translate(const problem_spec &problem, const language_profile &language,
                         const std::string &code, const std::string &nonce);

/**
 * @brief 同上，nonce 随机生成
 */
harness_source translate(const problem_spec &problem, const language_profile &language,
                         const std::string &code);

/**
 * @brief 按目标语言输出函数签名，用于展示初始代码
 * @throw translation_error(MALFORMED_SIGNATURE) 若签名不合法
 */
std::string render_signature(const function_signature &signature, const language_profile &language);

std::string render_signature(const problem_spec &problem, const language_profile &language);

/**
 * @brief 在题目加载时检查题目能否翻译到它支持的所有语言
 * @throw translation_error 若签名或测试不合法
 * @throw invalid_request 若题目声明支持的语言不存在，或者时间、内存限制不是正数
 */
void validate(const problem_spec &problem, const language_registry &languages);

}  // namespace grader::translate
