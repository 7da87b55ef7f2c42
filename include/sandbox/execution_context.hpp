#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace grader::sandbox {

/**
 * @brief 沙箱的运行环境配置
 * 在评测服务启动时根据配置创建一次，然后注入给执行器，所有运行共享同一份只读配置。
 */
struct execution_context {
    /**
     * @brief 每次运行的私有工作目录都创建在该目录下，<scratch_root>/<uuid>
     */
    std::filesystem::path scratch_root = "/tmp/grader";

    /**
     * @brief 是否为选手程序创建独立的网络命名空间
     */
    bool isolate_network = true;

    /**
     * @brief 若为真，无法隔离网络时拒绝运行；否则只记录警告
     */
    bool require_network_isolation = true;

    /**
     * @brief 标准输出和标准错误流各自最多保留的字节数，超出部分读出后丢弃
     */
    std::size_t output_limit = 64 * 1024;

    /**
     * @brief 进程数限制，-1 表示不限制
     * 注意 RLIMIT_NPROC 按用户计数，评测服务自身的线程也计算在内
     */
    int proc_limit = -1;

    /**
     * @brief 单个文件最大大小（KB），-1 表示不限制
     */
    int file_limit = 64 * 1024;

    /**
     * @brief 选手程序的 PATH，也用于查找解释器
     */
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";

    /**
     * @brief 所有运行共用的附加环境变量
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 看门狗轮询管道和子进程状态的间隔
     */
    std::chrono::milliseconds poll_interval{10};

    /**
     * @brief 采样进程树内存占用的间隔
     */
    std::chrono::milliseconds memory_sample_interval{50};

    /**
     * @brief 子进程退出后，继续读取管道剩余输出的最长时间
     */
    std::chrono::milliseconds drain_timeout{1000};

    /**
     * @brief 调试用，运行结束后保留工作目录
     */
    bool keep_scratch = false;
};

}  // namespace grader::sandbox
