#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 在 search_path（冒号分隔）中查找可执行文件
 * @param program 程序名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件的绝对路径，找不到时为空
 */
std::optional<std::filesystem::path> find_executable(const std::string &program, const std::string &search_path);

/**
 * @brief 去掉字符串首尾的空白字符
 */
std::string trim(const std::string &str);

/**
 * @brief 按行拆分字符串，不包含换行符，兼容 \r\n
 */
std::vector<std::string> split_lines(const std::string &str);

/**
 * @brief 生成随机的 uuid 字符串
 */
std::string random_uuid();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
