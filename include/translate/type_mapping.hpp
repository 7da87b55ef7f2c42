#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * 题目签名使用的规范类型词汇表，以及规范类型到目标语言类型的映射
 * 规范类型的写法接近 Python 的类型标注，比如 list[int]、dict[str, list[int]]、int | None
 */
namespace grader::translate {

enum class type_kind {
    INT,
    FLOAT,
    BOOL,
    STR,
    NONE,
    ANY,
    LIST,
    TUPLE,
    SET,
    DICT,
    OPTIONAL
};

/**
 * @brief 一个规范类型，比如 list[int] 表示为 {LIST, {{INT}}}
 */
struct canonical_type {
    type_kind kind = type_kind::ANY;
    std::vector<canonical_type> arguments;

    bool operator==(const canonical_type &other) const;
};

/**
 * @brief 目标语言的类型映射表
 * 每一项是一个模板：
 * {0}、{1} 表示第几个类型参数，
 * {0?} 表示第 0 个参数，若其包含空格则加上括号（比如 TypeScript 的 (number | null)[]），
 * {*} 表示用 ", " 连接的全部类型参数。
 */
struct type_table {
    std::map<type_kind, std::string> patterns;
};

/**
 * @brief 词汇表中的全部类型，用来检查映射表是否完整
 */
const std::vector<type_kind> &all_type_kinds();

/**
 * @brief 查找类型名，支持 Python 风格的别名（None、List、Optional、Any 等）
 */
std::optional<type_kind> lookup_type_name(const std::string &name);

/**
 * @brief 解析规范类型
 * @throw translation_error(MALFORMED_SIGNATURE) 若类型无法解析或者不在词汇表中
 */
canonical_type parse_type(const std::string &text);

/**
 * @brief 将类型转换回规范写法，比如 list[int]
 */
std::string to_string(const canonical_type &type);

/**
 * @brief 使用映射表将规范类型翻译成目标语言的类型
 * @throw internal_error 若映射表缺少某个类型，这说明语言配置有缺陷
 */
std::string render_type(const canonical_type &type, const type_table &table);

/**
 * @brief 检查映射表是否覆盖了整个词汇表
 * @return 缺少的类型，为空表示完整
 */
std::vector<type_kind> missing_types(const type_table &table);

}  // namespace grader::translate
