#pragma once

#include <string>
#include "harness/harness.hpp"
#include "judge/submission.hpp"
#include "judge/verdict.hpp"
#include "sandbox/runner.hpp"
#include "workspace.hpp"

namespace quizjudge {

/**
 * @brief 表示一种题目类型的评测逻辑
 * judger 不保存任何评测状态，judge 可以被多个线程同时调用
 */
struct judger {
    virtual ~judger();

    /**
     * @brief judger 负责评测哪种类型的提交
     * 目前可以为：code, query, choice
     */
    virtual std::string type() const = 0;

    /**
     * @brief 检查提交和测试规格是不是当前 judger 所负责的，而且内部约束都满足
     * @param submit 要检查正确性的提交
     * @param spec 出题人给定的测试规格
     * @return true 若提交和测试规格是合法的
     */
    virtual bool verify(const submission &submit, const test_spec &spec) const = 0;

    /**
     * @brief 评测一个提交
     * 调用方确保提交和测试规格已经通过验证
     * @return 评测结果，评测出错时抛出 judge_exception 的子类，由调用方转换为 verdict
     */
    virtual verdict judge(const submission &submit, const test_spec &spec) const = 0;
};

/**
 * @brief 需要在沙箱中运行评测脚本的 judger
 * 评测流程：生成评测脚本 → 分配工作目录 → 检查工作目录可写 → 写入文件 → 运行沙箱 → 回收工作目录
 */
struct sandboxed_judger : public judger {
    sandboxed_judger(const workspace_manager &workspaces, const sandbox_runner &runner, const harness_generator &generator);

protected:
    /**
     * @brief 在新的工作目录中运行评测脚本，返回前工作目录已经被回收
     */
    execution_result execute(const submission &submit, const harness &h, const sandbox_limits &limits) const;

    const workspace_manager &workspaces;
    const sandbox_runner &runner;
    const harness_generator &generator;
};

}  // namespace quizjudge
