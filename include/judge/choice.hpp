#pragma once

#include "judge/judger.hpp"

namespace quizjudge {

/**
 * @brief 评测单选题的 Judger 类，不需要沙箱
 */
struct choice_judger : public judger {
    std::string type() const override;

    bool verify(const submission &submit, const test_spec &spec) const override;

    verdict judge(const submission &submit, const test_spec &spec) const override;
};

}  // namespace quizjudge
