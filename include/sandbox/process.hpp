#pragma once

#include "sandbox/runner.hpp"

namespace quizjudge {

/**
 * @brief 在本机上以受限子进程运行评测脚本
 * 在容器引擎不可用时使用。子进程：
 * 1. 运行在独立的会话和进程组中，超时时整个进程组被杀死
 * 2. 通过 rlimit 限制地址空间、CPU 时间、文件大小，禁止 core dump
 * 3. 尽可能进入新的 user 和 network namespace 以断开网络，失败时只记录警告
 * CPU 配额无法通过 rlimit 实现，被忽略。
 */
struct process_runner : public sandbox_runner {
    /**
     * @param interpreter 若非空，替换命令中的解释器，比如 /usr/bin/python3
     */
    explicit process_runner(const std::string &interpreter = "");

    std::string type() const override;

    execution_result run(const workspace &ws, const std::vector<std::string> &command, const sandbox_limits &limits) const override;

private:
    std::string interpreter;
};

}  // namespace quizjudge
