#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = scoped_guard() + [&]

/**
 * @brief 在作用域结束时执行清理函数
 * 清理函数抛出的异常会被记录到日志中，不会向外传播
 * @code{.cpp}
 *     defer { remove_container(name); };
 * @endcode
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 放弃执行清理函数
     */
    void dismiss();

private:
    std::function<void()> f;
};
