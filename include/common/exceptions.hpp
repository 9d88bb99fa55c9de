#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include "common/status.hpp"

namespace quizjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);
    judge_exception(const std::string &message, const std::string &raw_output);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 该异常对应的评测错误类型，由 evaluator 转换为 verdict 时使用
     */
    virtual judge_fault fault() const noexcept;

    /**
     * @brief 出错时沙箱已经产生的输出，用于展示给选手
     */
    const std::optional<std::string> &raw_output() const noexcept;

private:
    std::string message;
    std::optional<std::string> output;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 无法在 scratch 根目录下创建工作目录
 */
struct allocation_error : public judge_exception {
    explicit allocation_error(const std::string &message);
    judge_fault fault() const noexcept override;
};

/**
 * @brief 工作目录不可写
 * 在启动任何沙箱之前检查，检查失败时不会启动沙箱
 */
struct permission_error : public judge_exception {
    explicit permission_error(const std::string &message);
    judge_fault fault() const noexcept override;
};

/**
 * @brief 生成评测脚本所需的模板文件不存在
 */
struct asset_missing_error : public judge_exception {
    explicit asset_missing_error(const std::string &message);
    judge_fault fault() const noexcept override;
};

/**
 * @brief 容器引擎无法访问，或者镜像不存在，或者无法启动子进程
 */
struct sandbox_unavailable_error : public judge_exception {
    explicit sandbox_unavailable_error(const std::string &message);
    judge_fault fault() const noexcept override;
};

/**
 * @brief 沙箱内的程序以非零返回值退出
 */
struct sandbox_fault : public judge_exception {
    sandbox_fault(const std::string &message, int exitcode, const std::string &raw_output);
    judge_fault fault() const noexcept override;

    const int exitcode;
};

/**
 * @brief 沙箱运行超出时钟时间限制
 * 和 sandbox_fault 严格区分
 */
struct time_limit_exceeded : public judge_exception {
    time_limit_exceeded(const std::string &message, const std::string &raw_output);
    judge_fault fault() const noexcept override;
};

/**
 * @brief 评测脚本输出的 payload 格式不正确
 * 无论如何都不能把这种情况当成答案正确
 */
struct payload_parse_error : public judge_exception {
    explicit payload_parse_error(const std::string &message);
    payload_parse_error(const std::string &message, const std::string &raw_output);
    judge_fault fault() const noexcept override;
};

/**
 * @brief 提交内容不合法，比如选择题答案不是数字，或者提交与测试规格的题型不符
 */
struct invalid_submission : public judge_exception {
    explicit invalid_submission(const std::string &message);
    judge_fault fault() const noexcept override;
};

}  // namespace quizjudge
