#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "translate/expression.hpp"
#include "translate/type_mapping.hpp"

namespace grader::translate {

/**
 * @brief 一种目标语言的全部配置
 * 新增语言只需要新增一份配置，翻译器和沙箱不需要修改。
 * 模板中的 {{name}} 形式的占位符会在使用时被替换。
 */
struct language_profile {
    /**
     * @brief 语言名，比如 python
     */
    std::string name;

    /**
     * @brief 语言别名，比如 py
     */
    std::vector<std::string> aliases;

    /**
     * @brief 选手程序（拼接后的测试程序）的文件名
     */
    std::string source_file;

    /**
     * @brief 运行命令，{{source}} 会被替换为 source_file
     * 第一项为解释器，在沙箱的 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 需要一同写入工作目录的附加文件，比如 TypeScript 的 package.json
     */
    std::map<std::string, std::string> extra_files;

    /**
     * @brief 运行时的附加环境变量
     */
    std::map<std::string, std::string> environment;

    type_table types;

    literal_syntax literals;

    /**
     * @brief 渲染签名，占位符：{{name}}、{{parameters}}、{{return_type}}、{{parameter_docs}}
     */
    std::string signature_template;

    /**
     * @brief 渲染单个参数，占位符：{{name}}、{{type}}
     */
    std::string parameter_template;

    /**
     * @brief 渲染单个参数的文档注释行，为空表示不需要
     */
    std::string parameter_doc_template;

    /**
     * @brief 函数类型，占位符：{{parameters}}、{{parameter_types}}、{{return_type}}
     */
    std::string function_type_template;

    /**
     * @brief 将选手函数绑定到固定别名，占位符：{{alias}}、{{function}}、{{function_type}}
     */
    std::string shim_template;

    /**
     * @brief 选手函数名与签名不一致时，额外绑定规范函数名，占位符：{{canonical}}、{{function}}
     */
    std::string canonical_bind_template;

    /**
     * @brief 查找指定函数声明的正则表达式，{{name}} 为函数名
     */
    std::vector<std::string> declaration_patterns;

    /**
     * @brief 查找任意顶层函数声明的正则表达式，第 1 组为函数名，第 2 组为参数列表
     */
    std::vector<std::string> function_patterns;

    /**
     * @brief 测试程序的公共部分（上报函数、深比较函数），{{delimiter}} 为测试结果标记
     */
    std::string prelude;

    /**
     * @brief 一个测试点，占位符：{{index}}、{{body}}
     */
    std::string test_template;

    /**
     * @brief 一条断言，占位符：{{indent}}、{{condition}}
     */
    std::string assertion_template;

    /**
     * @brief 测试点函数体的缩进
     */
    std::string body_indent;
};

/**
 * @brief 替换模板中的 {{key}} 占位符
 */
std::string expand_template(const std::string &pattern, const std::map<std::string, std::string> &values);

language_profile python_profile();

language_profile typescript_profile();

language_profile javascript_profile();

/**
 * @brief 语言注册表，按语言名或别名查找语言配置
 */
struct language_registry {
    /**
     * @brief 创建包含内置语言 python、typescript、javascript 的注册表
     */
    language_registry();

    /**
     * @brief 注册或替换一种语言
     * @throw internal_error 若类型映射表不完整
     */
    void add(language_profile profile);

    /**
     * @brief 按配置文件覆盖语言的运行命令与环境变量
     * 格式为 {"python": {"command": ["python3.12", "{{source}}"], "environment": {...}}}
     * @throw invalid_request 若配置中的语言不存在
     */
    void configure(const nlohmann::json &j);

    /**
     * @brief 将语言名或别名规范化，比如 ts 到 typescript
     * @throw invalid_request 若语言不存在
     */
    std::string normalize(const std::string &name) const;

    /**
     * @throw invalid_request 若语言不存在
     */
    const language_profile &get(const std::string &name) const;

    bool contains(const std::string &name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, language_profile> profiles;
    std::map<std::string, std::string> aliases;
};

}  // namespace grader::translate
