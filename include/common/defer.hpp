#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_guard) = ::grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 在作用域结束时执行清理函数，配合 defer 宏使用
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

private:
    std::function<void()> f;
};

}  // namespace grader
