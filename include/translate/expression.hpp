#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

/**
 * 测试断言的语言无关表示
 * 题目作者用 Python 风格书写断言（True/False/None、==、is），
 * 评测前解析成语法树，再按目标语言的字面量语法重新输出。
 */
namespace grader::translate {

struct expression;

struct null_literal {};

struct bool_literal {
    bool value;
};

/**
 * @brief 数字字面量，保留原始写法以免丢失精度
 */
struct number_literal {
    std::string text;
};

struct string_literal {
    std::string value;
};

struct list_literal {
    std::vector<expression> elements;
};

struct tuple_literal {
    std::vector<expression> elements;
};

struct set_literal {
    std::vector<expression> elements;
};

struct dict_literal {
    std::vector<std::pair<expression, expression>> entries;
};

struct identifier {
    std::string name;
};

struct call {
    std::string callee;
    std::vector<expression> arguments;
};

enum class comparison_operator {
    EQUAL,
    NOT_EQUAL,
    LESS,
    LESS_EQUAL,
    GREATER,
    GREATER_EQUAL,
    IS,
    IS_NOT
};

struct comparison {
    comparison_operator op;
    std::shared_ptr<expression> lhs, rhs;
};

enum class logical_operator { AND, OR };

struct logical {
    logical_operator op;
    std::shared_ptr<expression> lhs, rhs;
};

struct negation {
    std::shared_ptr<expression> operand;
};

struct expression {
    std::variant<null_literal, bool_literal, number_literal, string_literal,
                 list_literal, tuple_literal, set_literal, dict_literal,
                 identifier, call, comparison, logical, negation>
        node;
};

/**
 * @brief 目标语言的字面量与运算符写法
 * equal_template 等模板中 {{lhs}}、{{rhs}} 会被替换为左右操作数
 */
struct literal_syntax {
    std::string null_literal = "None";
    std::string true_literal = "True";
    std::string false_literal = "False";

    // 元组在 TypeScript 中用数组表示
    std::string tuple_open = "(";
    std::string tuple_close = ")";
    bool single_tuple_trailing_comma = true;

    std::string set_open = "{";
    std::string set_close = "}";
    std::string empty_set = "set()";

    std::string and_operator = "and";
    std::string or_operator = "or";
    std::string not_template = "not {{operand}}";

    std::string equal_template = "{{lhs}} == {{rhs}}";
    std::string not_equal_template = "{{lhs}} != {{rhs}}";
    std::string is_template = "{{lhs}} is {{rhs}}";
    std::string is_not_template = "{{lhs}} is not {{rhs}}";
};

/**
 * @brief 解析一条断言，可以带 assert 前缀与 Python 风格的断言消息（assert x == y, "msg"）
 * @throw translation_error(MALFORMED_TEST) 若无法解析
 */
expression parse_assertion(const std::string &text);

/**
 * @brief 解析一个表达式，通常是结构化测试的输入或期望值
 * @throw translation_error(MALFORMED_TEST) 若无法解析
 */
expression parse_expression(const std::string &text);

/**
 * @brief 按目标语言输出表达式
 * @param renames 函数调用的重命名表，用于将规范函数名改写为绑定后的别名
 */
std::string render_expression(const expression &expr, const literal_syntax &syntax,
                              const std::map<std::string, std::string> &renames = {});

/**
 * @brief 构造比较表达式 lhs op rhs
 */
expression make_comparison(comparison_operator op, expression lhs, expression rhs);

}  // namespace grader::translate
