#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = quizjudge::scoped_guard() + [&]

namespace quizjudge {

/**
 * @brief 离开作用域时执行清理函数
 * 清理函数抛出的异常会被记录到日志中，不会从析构函数中抛出，
 * 因此清理过程中的错误不会掩盖正在传播的异常。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace quizjudge
