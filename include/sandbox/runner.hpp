#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "workspace.hpp"

namespace quizjudge {

/**
 * @brief 沙箱的资源限制
 */
struct sandbox_limits {
    /**
     * @brief 时钟时间限制，单位为秒
     * 超时的沙箱会被强制杀死
     */
    double wall_time_limit = 5;

    /**
     * @brief 内存限制，单位为字节，容器后端同时用作 swap 上限
     */
    int64_t memory_limit = 512ll << 20;

    /**
     * @brief CPU 配额，quota / period 为可用的 CPU 核数
     * 只有容器后端支持
     */
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 50000;

    /**
     * @brief 单个文件大小上限，单位为字节，只有进程后端支持
     */
    int64_t file_limit = 16ll << 20;

    /**
     * @brief stdout、stderr 各自最多保留的字节数，超出部分被丢弃
     */
    size_t output_limit = 1 << 20;

    /**
     * @brief 是否禁止沙箱访问网络
     */
    bool network_disabled = true;
};

/**
 * @brief 沙箱中一次运行的结果
 * stdout 和 stderr 分开保存，只有 stdout 会被当作评测脚本的 payload 解析
 */
struct execution_result {
    std::string output;
    std::string error;

    /**
     * @brief 程序的返回值，被信号杀死时为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 是否因为超出时钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 输出是否因为超出 output_limit 而被截断
     */
    bool truncated = false;

    /**
     * @brief 运行耗费的时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 沙箱后端
 * 目前有两种实现：
 * 1. container_runner，通过容器引擎在隔离的容器中运行（默认）
 * 2. process_runner，在本机上以受限的子进程运行，隔离程度较弱
 * run 可以被多个评测线程同时调用
 */
struct sandbox_runner {
    virtual ~sandbox_runner();

    /**
     * @brief 后端名称：container 或 process
     */
    virtual std::string type() const = 0;

    /**
     * @brief 在工作目录中运行命令
     * @param ws 工作目录，已经写入了评测脚本需要的所有文件
     * @param command 要执行的命令，command[0] 是解释器，其余参数中的文件均为工作目录内的相对路径
     * @param limits 资源限制
     * @return 运行结果，超时和非零返回值都通过返回值报告，不抛出异常
     * @throw sandbox_unavailable_error 若沙箱无法启动
     */
    virtual execution_result run(const workspace &ws, const std::vector<std::string> &command, const sandbox_limits &limits) const = 0;
};

/**
 * @brief 将一段输出追加到缓冲区，超出 limit 的部分丢弃
 * @param truncated 若发生截断则设为 true
 */
void append_limited(std::string &buffer, const char *data, size_t size, size_t limit, bool &truncated);

}  // namespace quizjudge
