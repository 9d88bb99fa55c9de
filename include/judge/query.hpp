#pragma once

#include "judge/judger.hpp"

namespace quizjudge {

/**
 * @brief 评测 SQL 题的 Judger 类
 * 选手查询和标准查询分别在以同一建表脚本初始化的全新数据库中执行，
 * 列名和结果行（包括顺序）完全一致时答案正确
 */
struct query_judger : public sandboxed_judger {
    using sandboxed_judger::sandboxed_judger;

    std::string type() const override;

    bool verify(const submission &submit, const test_spec &spec) const override;

    verdict judge(const submission &submit, const test_spec &spec) const override;
};

}  // namespace quizjudge
