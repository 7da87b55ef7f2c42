#pragma once

#include <string>
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 一次运行在评测引擎中的状态
 * 简易运行：QUEUED -> EXECUTING -> CLASSIFYING -> COMPLETED
 * 评测：QUEUED -> TRANSLATING -> EXECUTING -> CLASSIFYING -> COMPLETED
 * 翻译失败或无法启动程序时进入 FAILED，评测队列已满时进入 REJECTED
 */
enum class submission_state {
    QUEUED,
    TRANSLATING,
    EXECUTING,
    CLASSIFYING,
    COMPLETED,
    FAILED,
    REJECTED
};

const char *get_state_name(submission_state state);

/**
 * @brief 监听评测引擎的运行过程
 * 回调在 worker 线程中执行，实现需要自行保证线程安全。
 * 回调抛出的异常会被记录到日志，不会影响评测结果。
 */
struct execution_listener {
    virtual ~execution_listener();

    /**
     * @brief 上报一次运行的状态变化
     * @param execution_id 运行编号
     * @param state 新状态
     */
    virtual void state_changed(const std::string &execution_id, submission_state state);

    /**
     * @brief 上报一次运行已经结束，调用方可以在这里保存历史记录
     * @param request 运行请求
     * @param result 运行结果
     */
    virtual void completed(const submission_request &request, const execution_result &result);
};

}  // namespace grader
