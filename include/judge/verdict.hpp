#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace quizjudge {

/**
 * @brief 编程题一个测试点的评测结果
 * @note actual 存在当且仅当 error 不存在
 */
struct test_case_result {
    std::string name;

    /**
     * @brief 回显的输入参数
     */
    nlohmann::json input;

    /**
     * @brief 回显的期望返回值
     */
    nlohmann::json expected;

    /**
     * @brief 被测函数的实际返回值，测试点出错时为空
     */
    std::optional<nlohmann::json> actual;

    bool passed = false;

    /**
     * @brief 测试点内抛出的异常信息，只影响当前测试点
     */
    std::optional<std::string> error;
};

void to_json(nlohmann::json &j, const test_case_result &result);

/**
 * @brief 一次评测的最终结果，每次 evaluate 调用恰好产生一个
 * 渲染 verdict 没有任何副作用，可以重复渲染
 */
struct verdict {
    quizjudge::status status = quizjudge::status::ERROR;

    /**
     * @brief 评测过程中出现的错误，正常评测时为 NONE
     */
    judge_fault fault = judge_fault::NONE;

    /**
     * @brief 对于编程题，是所有测试点是否通过的逻辑与；对于 SQL 题，是列名和结果行
     * 的有序比较结果；对于选择题，是选项编号的比较结果
     */
    bool passed_all = false;

    /**
     * @brief 给选手看的评测报告
     * 编程题：
     * @code{.json}
     * {
     *   "type": "code",
     *   "message": "All tests passed!",
     *   "pass_cases": 1,
     *   "total_cases": 1,
     *   "cases": [{"name": "Test 1", "input": [3], "expected": 6, "actual": 6, "passed": true, "error": null}]
     * }
     * @endcode
     * SQL 题：
     * @code{.json}
     * {
     *   "type": "query",
     *   "message": "Correct!",
     *   "columns": ["name"],
     *   "rows": [["Alice"]]
     * }
     * @endcode
     * 选择题：
     * @code{.json}
     * {
     *   "type": "choice",
     *   "message": "Incorrect.",
     *   "correct_option": "4"
     * }
     * @endcode
     * 出错时：
     * @code{.json}
     * {
     *   "type": "error",
     *   "message": "Execution timed out (5 seconds)"
     * }
     * @endcode
     */
    nlohmann::json report;

    /**
     * @brief 沙箱中捕获的原始错误输出
     */
    std::optional<std::string> raw_error;

    std::string category;
    std::string prob_id;
    std::string sub_id;
};

void to_json(nlohmann::json &j, const verdict &v);

/**
 * @brief 构造表示评测出错的 verdict
 * @param fault 错误类型，不能为 NONE
 * @param message 给选手看的错误信息
 * @param raw_error 沙箱中捕获的原始输出
 */
verdict make_fault_verdict(judge_fault fault, const std::string &message, const std::optional<std::string> &raw_error = std::nullopt);

/**
 * @brief 将 verdict 渲染为给人看的纯文本报告
 */
std::string render_report(const verdict &v);

/**
 * @brief 将任意字节串转换为合法的 UTF-8 字符串
 * 沙箱输出的内容不受控制，写入 JSON 前必须经过这一步
 */
std::string sanitize_text(const std::string &text);

}  // namespace quizjudge
