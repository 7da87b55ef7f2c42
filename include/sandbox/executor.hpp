#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/execution_context.hpp"
#include "sandbox/stream_capture.hpp"

namespace grader::sandbox {

/**
 * @brief 一次运行的请求
 */
struct execution_request {
    /**
     * @brief 源文件名，写入私有工作目录
     */
    std::string source_file;

    std::string source;

    /**
     * @brief 附加文件，文件名到内容
     */
    std::map<std::string, std::string> extra_files;

    /**
     * @brief 运行命令，{{source}} 会被替换为 source_file
     */
    std::vector<std::string> command;

    /**
     * @brief 附加环境变量
     */
    std::map<std::string, std::string> environment;

    std::string stdin_data;

    /**
     * @brief 墙上时间限制，单位为秒，必须为正数
     */
    double time_limit = 2.0;

    /**
     * @brief 内存限制（MB），超出后终止进程树，非正数表示不限制
     */
    int memory_limit = -1;

    /**
     * @brief 测试结果标记的前缀，为空表示简易运行，不识别标记
     */
    std::string marker_delimiter;
};

/**
 * @brief 运行的原始结果，由结果分类器转换为最终状态
 */
struct raw_result {
    /**
     * @brief 退出码，被信号终止时为 128 + 信号编号
     */
    int exit_code = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 选手程序输出的总字节数（包括被截断丢弃的部分）
     */
    std::size_t stdout_bytes = 0;
    std::size_t stderr_bytes = 0;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    bool timed_out = false;

    bool killed_for_memory = false;

    /**
     * @brief 采样得到的进程树内存占用峰值，单位为字节
     */
    long long memory_peak = 0;

    /**
     * @brief 实际生效的时间限制（秒）与内存限制（MB）
     */
    double time_limit = 0;
    int memory_limit = -1;

    /**
     * @brief 按输出顺序排列的测试结果标记
     */
    std::vector<test_marker> markers;
};

/**
 * @brief 执行器
 * 负责在隔离环境中运行程序并收集原始结果，不关心结果的含义
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 运行程序，阻塞直到程序结束或者被看门狗终止
     * @throw launch_error 若程序无法启动
     */
    virtual raw_result execute(const execution_request &request) = 0;
};

/**
 * @brief 使用 fork/exec 在本机运行程序的执行器
 * 每次运行使用私有的工作目录、环境变量和管道，子进程处于独立的会话和网络命名空间中，
 * 看门狗负责超时和内存超限时终止整个进程树。
 */
struct process_executor : public executor {
    explicit process_executor(execution_context context);

    raw_result execute(const execution_request &request) override;

    const execution_context &context() const;

private:
    execution_context ctx;
};

/**
 * @brief 描述程序的退出状态，比如 "exit code 1" 或 "killed by signal 9 (SIGKILL)"
 */
std::string describe_exit(const raw_result &result);

}  // namespace grader::sandbox
