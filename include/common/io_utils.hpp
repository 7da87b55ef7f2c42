#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会逃出所在的文件夹
 * 语言配置中的附加文件名会被拼接到选手程序的私有工作目录下，
 * 如果文件名包含 "../" 或者是绝对路径，可能覆盖宿主机的文件。
 * @param subpath 被检查的文件名
 * @return subpath
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace grader
