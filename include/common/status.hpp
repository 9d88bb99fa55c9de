#pragma once

namespace quizjudge {

/**
 * @brief 表示一次评测的最终结果
 */
enum class status {
    /**
     * @brief 提交通过了所有测试
     * 对于编程题，所有测试点都通过；对于 SQL 题，列名和结果行（按顺序）都与标准查询一致；
     * 对于选择题，选项编号与标准答案一致。
     */
    CORRECT = 0,

    /**
     * @brief 提交被完整评测，但没有通过
     * 沙箱内程序以非零返回值退出也视为该结果。
     */
    INCORRECT = 1,

    /**
     * @brief 评测无法得出可信的结论
     * 比如超时、payload 无法解析、SQL 执行出错、评测系统内部错误。
     */
    ERROR = 2
};

/**
 * @brief 表示评测过程中出现的错误类型
 * 每个 verdict 都会携带一个 fault，评测正常完成时为 NONE
 */
enum class judge_fault {
    NONE = 0,

    /**
     * @brief 无法创建工作目录
     */
    ALLOCATION_ERROR = 1,

    /**
     * @brief 工作目录不可写
     */
    PERMISSION_DENIED = 2,

    /**
     * @brief 评测脚本模板不存在
     */
    ASSET_MISSING = 3,

    /**
     * @brief 容器引擎或者镜像不可用，或者无法启动子进程
     */
    SANDBOX_UNAVAILABLE = 4,

    /**
     * @brief 沙箱内程序以非零返回值退出
     */
    SANDBOX_FAULT = 5,

    /**
     * @brief 沙箱运行超出时钟时间限制，沙箱已被强制终止
     */
    TIME_LIMIT_EXCEEDED = 6,

    /**
     * @brief 评测脚本的输出无法解析，或者与测试规格不一致
     */
    PAYLOAD_MALFORMED = 7,

    /**
     * @brief 提交内容不合法
     */
    INVALID_SUBMISSION = 8,

    /**
     * @brief SQL 语句（建表脚本、选手查询或标准查询）执行出错
     */
    QUERY_ERROR = 9,

    /**
     * @brief 评测系统内部错误
     */
    INTERNAL_ERROR = 10
};

const char *get_display_message(status);

const char *get_display_message(judge_fault);

/**
 * @brief 在 JSON 中使用的小写名称，比如 "correct"、"time_limit_exceeded"
 */
const char *get_name(status);

const char *get_name(judge_fault);

/**
 * @brief 除 SANDBOX_FAULT 以外，所有错误都会使评测结果为 ERROR
 * @note fault 为 NONE 时返回 CORRECT，此时是否正确由调用方比较答案决定
 */
status status_of(judge_fault);

}  // namespace quizjudge
