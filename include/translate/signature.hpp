#pragma once

#include <string>
#include <vector>
#include "translate/type_mapping.hpp"

namespace grader::translate {

struct parameter {
    std::string name;

    canonical_type type;

    /**
     * @brief 签名中是否标注了类型，未标注的参数类型为 any
     */
    bool annotated = false;
};

/**
 * @brief 题目作者编写的规范函数签名
 * 写法为 [def] name(p1: T1, p2: T2) [-> R][:]，比如
 * def two_sum(nums: list[int], target: int) -> list[int]:
 */
struct function_signature {
    std::string name;

    std::vector<parameter> parameters;

    canonical_type return_type;

    bool has_return_type = false;
};

/**
 * @brief 解析规范函数签名
 * @throw translation_error(MALFORMED_SIGNATURE) 若签名不合法，比如括号不匹配、参数重名、类型未知
 */
function_signature parse_signature(const std::string &text);

/**
 * @brief 将签名转换回规范写法，不带 def 前缀和冒号
 */
std::string to_string(const function_signature &signature);

/**
 * @brief 按照顶层逗号计算参数列表中参数的个数，方括号、圆括号、尖括号和花括号内的逗号不计
 * @param params 括号内的参数列表文本，比如 "a: list[int], b = (1, 2)"
 */
std::size_t count_parameters(const std::string &params);

}  // namespace grader::translate
