#pragma once

#include <future>
#include <memory>
#include <vector>
#include "config.hpp"
#include "judge/listener.hpp"
#include "judge/problem.hpp"
#include "judge/submission.hpp"
#include "judge/worker_pool.hpp"
#include "sandbox/executor.hpp"
#include "translate/language.hpp"

namespace grader {

/**
 * @brief 评测引擎
 * 将翻译器、执行器和结果分类器组合成简易运行和评测两种操作。
 * 每个提交在线程池中占用一个位置，直到翻译、运行、分类全部完成为止。
 * 引擎不会重试，也不保存任何结果，历史记录由监听器负责。
 */
struct engine {
    /**
     * @param config 引擎配置，决定线程池大小和默认限制
     * @param languages 语言注册表
     * @param runner 执行器，所有 worker 共享，必须可以并发调用
     */
    engine(engine_config config, translate::language_registry languages, std::unique_ptr<sandbox::executor> runner);

    /**
     * @brief 等待所有已经接受的提交运行完成
     */
    ~engine();

    /**
     * @brief 直接运行选手代码，不评测
     * @throw invalid_request 若语言不存在或者代码超出长度限制
     * @throw system_busy 若评测队列已满
     */
    execution_result run_bare(const submission_request &request);

    /**
     * @brief 运行题目的测试并给出每个测试点的结果
     * @throw invalid_request 若语言不存在、题目不支持该语言、题目没有测试或者代码超出长度限制
     * @throw system_busy 若评测队列已满
     */
    execution_result run_graded(const submission_request &request, const problem_spec &problem);

    /**
     * @brief 异步版本的 run_bare，异常同样在提交时同步抛出
     */
    std::future<execution_result> submit_bare(submission_request request);

    /**
     * @brief 异步版本的 run_graded
     */
    std::future<execution_result> submit_graded(submission_request request, std::shared_ptr<const problem_spec> problem);

    /**
     * @brief 注册监听器
     * 注册表不加锁，必须在提交任何运行之前完成注册
     */
    void register_listener(std::unique_ptr<execution_listener> &&listener);

    pool_stats stats() const;

    const engine_config &config() const;

    const translate::language_registry &languages() const;

private:
    std::future<execution_result> admit(const std::string &execution_id, std::function<execution_result()> job);

    execution_result process_bare(const std::string &execution_id, const submission_request &request,
                                  const translate::language_profile &language);

    execution_result process_graded(const std::string &execution_id, const submission_request &request,
                                    const problem_spec &problem, const translate::language_profile &language);

    /**
     * @brief 运行程序并分类，翻译失败之外的公共部分
     */
    execution_result execute_and_classify(const std::string &execution_id, const sandbox::execution_request &exec,
                                          const std::vector<test_case> *tests);

    execution_result finish(const submission_request &request, execution_result result);

    void report_state(const std::string &execution_id, submission_state state);

    engine_config cfg;
    translate::language_registry registry;
    std::unique_ptr<sandbox::executor> runner;
    std::vector<std::unique_ptr<execution_listener>> listeners;

    // 声明在最后，因此最先析构：等待 worker 结束时其他成员仍然有效
    std::unique_ptr<worker_pool> pool;
};

/**
 * @brief 计算实际生效的时间限制
 * @param requested 提交要求的时间限制，非正数表示使用默认值
 * @param fallback 默认值
 * @param ceiling 上限
 */
double effective_time_limit(double requested, double fallback, double ceiling);

/**
 * @brief 计算实际生效的内存限制，参数含义同上
 */
int effective_memory_limit(int requested, int fallback, int ceiling);

}  // namespace grader
