#pragma once

#include "judge/judger.hpp"

namespace quizjudge {

/**
 * @brief 评测编程题的 Judger 类
 * 在沙箱中依次以每个测试点的参数调用选手提交的函数，比较返回值和期望值
 */
struct code_judger : public sandboxed_judger {
    using sandboxed_judger::sandboxed_judger;

    std::string type() const override;

    bool verify(const submission &submit, const test_spec &spec) const override;

    verdict judge(const submission &submit, const test_spec &spec) const override;
};

}  // namespace quizjudge
