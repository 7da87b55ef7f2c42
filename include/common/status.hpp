#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示一次运行（简易运行或评测）的最终结果
 */
enum class status {
    /**
     * @brief 程序正常结束
     * 简易运行时要求退出码为 0；评测时还要求所有测试点均通过
     */
    SUCCESS = 0,

    /**
     * @brief 至少有一个测试点没有通过
     * 只会在评测时出现
     */
    FAILURE = 1,

    /**
     * @brief 运行出错
     * 包括运行时错误、内存超限、题目翻译失败、沙箱启动失败，
     * 具体原因见 error_kind
     */
    ERROR = 2,

    /**
     * @brief 程序运行时间超出限制，被看门狗强制终止
     * 即使终止前所有已报告的测试点都通过，也认为结果不可靠
     */
    TIMEOUT = 3
};

/**
 * @brief 运行失败的具体原因，返回给调用方时使用 get_reason_code 转成字符串
 */
enum class error_kind {
    NONE = 0,
    MALFORMED_SIGNATURE,
    SIGNATURE_NOT_FOUND,
    MALFORMED_TEST,
    LAUNCH_ERROR,
    TIME_LIMIT_EXCEEDED,
    RUNTIME_FAULT,
    MEMORY_LIMIT_EXCEEDED
};

const char *get_display_message(status);

/**
 * @brief 获得 status 的字符串表示，比如 "success"
 */
const char *get_status_string(status);

/**
 * @brief 根据字符串获得 status
 * @throw std::invalid_argument 若字符串不是合法的状态
 */
status parse_status(const std::string &text);

/**
 * @brief 获得 error_kind 的原因代码，比如 "memory_limit_exceeded"，NONE 为空串
 */
const char *get_reason_code(error_kind);

}  // namespace grader
