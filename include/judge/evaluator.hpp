#pragma once

#include <map>
#include <memory>
#include "judge/judger.hpp"

namespace quizjudge {

/**
 * @brief 评测核心的入口
 * 每次 evaluate 调用相互独立，不保存任何跨调用的状态，可以被多个线程同时调用。
 * 工作目录管理器、沙箱后端、评测脚本生成器由调用方构造并注入，
 * 它们的生命周期必须长于 evaluator。
 */
struct evaluator {
    evaluator(const workspace_manager &workspaces, const sandbox_runner &runner, const harness_generator &generator);

    /**
     * @brief 评测一个提交
     * 任何错误都会被转换为 status=error 的 verdict，该函数不会抛出异常
     * @param submit 选手提交
     * @param spec 出题人给定的测试规格，类型必须与提交类型一致
     * @return 恰好一个 verdict，其中回显了提交的 category、prob_id、sub_id
     */
    verdict evaluate(const submission &submit, const test_spec &spec) const noexcept;

    /**
     * @brief 查找负责该类型提交的 judger
     * @throw invalid_submission 若不存在对应的 judger
     */
    const judger &get_judger(language lang) const;

private:
    verdict evaluate_impl(const submission &submit, const test_spec &spec) const;

    std::map<language, std::unique_ptr<judger>> judgers;
};

}  // namespace quizjudge
