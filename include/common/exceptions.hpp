#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出位置的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎自身的内部错误
 * 一般是代码缺陷，比如类型映射表不完整
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 题目定义无法翻译成目标语言的测试代码
 * 这是题目内容的问题，不能归咎于选手提交
 */
struct translation_error : public grader_exception {
    enum class kind {
        /**
         * @brief 函数签名无法解析（括号不匹配、未知类型等）
         */
        MALFORMED_SIGNATURE,

        /**
         * @brief 选手代码中找不到与签名对应的函数声明
         */
        SIGNATURE_NOT_FOUND,

        /**
         * @brief 测试断言无法解析
         */
        MALFORMED_TEST
    };

    translation_error(kind type, const std::string &message);

    kind type() const noexcept;

    /**
     * @brief 返回给调用方的错误代码，比如 malformed_signature
     */
    const char *reason() const noexcept;

private:
    kind error_type;
};

/**
 * @brief 沙箱无法启动选手程序
 * 比如 fork 失败、解释器不存在、无法隔离网络。需要运维处理
 */
struct launch_error : public grader_exception {
    launch_error();
    explicit launch_error(const std::string &message);
};

/**
 * @brief 评测队列已满，调用方应稍后重试
 */
struct system_busy : public grader_exception {
    system_busy();
    explicit system_busy(const std::string &message);
};

/**
 * @brief 调用方传入的请求不合法，比如语言不受支持
 */
struct invalid_request : public grader_exception {
    invalid_request();
    explicit invalid_request(const std::string &message);
};

}  // namespace grader
