#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace grader::sandbox {

/**
 * @brief 测试程序输出的一个测试点结果标记
 */
struct test_marker {
    std::size_t index;
    bool passed;

    bool operator==(const test_marker &other) const;
};

/**
 * @brief 收集子进程的一个输出流
 * 保留至多 limit 字节的内容，超出部分只计数不保存；
 * 若设置了 delimiter，形如 "<delimiter> <index> PASS|FAIL" 的标记行会被识别并从内容中移除，
 * 标记的识别不受 limit 影响，即使选手程序输出大量内容也不会丢失测试结果。
 * 标记不要求位于行首，选手程序输出的未换行内容之后的标记同样会被识别。
 */
struct stream_capture {
    explicit stream_capture(std::size_t limit, std::string delimiter = "");

    /**
     * @brief 追加从管道读出的数据
     */
    void feed(const char *data, std::size_t size);

    /**
     * @brief 流已经结束，处理最后一行没有换行符的数据
     */
    void finish();

    /**
     * @brief 保留下来的内容，不包含标记行
     */
    const std::string &content() const;

    /**
     * @brief 选手程序输出的总字节数，不包含标记行
     */
    std::size_t total_bytes() const;

    bool truncated() const;

    const std::vector<test_marker> &markers() const;

private:
    std::size_t limit;
    std::string delimiter;
    std::string kept;
    std::size_t total = 0;

    // 尚未确定是否属于标记的数据：可能是 delimiter 的前缀，或者是未结束的标记行
    std::string pending;

    std::vector<test_marker> found;

    void emit(const char *data, std::size_t size);
    void scan(bool eof);
    bool parse_marker(const std::string &tail);
};

}  // namespace grader::sandbox
