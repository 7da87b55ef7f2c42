#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "sandbox/execution_context.hpp"

namespace grader {

/**
 * @brief 评测引擎的配置
 * 先从 JSON 配置文件读取，再由命令行参数和环境变量覆盖
 * @code{.json}
 * {
 *     "run_dir": "/tmp/grader",
 *     "workers": 4,
 *     "queue_capacity": 16,
 *     "languages": {
 *         "python": { "command": ["python3.12", "{{source}}"] }
 *     }
 * }
 * @endcode
 */
struct engine_config {
    /**
     * @brief 选手程序的运行目录，每次运行在该目录下创建私有的工作目录
     * 可以通过环境变量 RUNDIR 指定
     */
    std::filesystem::path run_dir = "/tmp/grader";

    /**
     * @brief 评测线程数，可以通过环境变量 WORKERS 指定
     */
    std::size_t workers = 4;

    /**
     * @brief 排队等待的提交数上限，超出时拒绝提交
     */
    std::size_t queue_capacity = 16;

    /**
     * @brief 标准输出和标准错误流各自保留的最大长度（KB）
     */
    std::size_t output_limit_kb = 64;

    /**
     * @brief 简易运行的默认时间限制，以及提交覆盖时间限制的上限（秒）
     */
    double default_time_limit_sec = 2.0;
    double max_time_limit_sec = 10.0;

    /**
     * @brief 简易运行的默认内存限制，以及提交覆盖内存限制的上限（MB）
     */
    int default_memory_limit_mb = 256;
    int max_memory_limit_mb = 1024;

    /**
     * @brief 选手代码的最大长度（KB），超出时拒绝提交
     */
    std::size_t source_limit_kb = 1024;

    /**
     * @brief 进程数限制，-1 表示不限制
     */
    int proc_limit = -1;

    /**
     * @brief 单个文件最大大小（KB）
     */
    int file_limit_kb = 64 * 1024;

    bool isolate_network = true;

    bool require_network_isolation = true;

    /**
     * @brief 选手程序的 PATH
     */
    std::string path = "/usr/local/bin:/usr/bin:/bin";

    /**
     * @brief 按语言覆盖运行命令与环境变量，格式见 language_registry::configure
     */
    nlohmann::json languages = nlohmann::json::object();

    /**
     * @brief 题目 JSON 文件所在的目录
     */
    std::filesystem::path problems_dir = "problems";

    /**
     * @brief 调试模式，运行结束后保留工作目录
     * 可以通过环境变量 DEBUG 打开
     */
    bool debug = false;
};

void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 读取 JSON 配置文件
 * @throw invalid_request 若文件不存在或者格式不正确
 */
engine_config load_config(const std::filesystem::path &path);

/**
 * @brief 根据配置生成沙箱的运行环境
 */
sandbox::execution_context make_execution_context(const engine_config &config);

}  // namespace grader
