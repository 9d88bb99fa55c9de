#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/submission.hpp"
#include "judge/verdict.hpp"
#include "sandbox/runner.hpp"

namespace quizjudge {

/**
 * @brief 不做任何类型转换的 JSON 值比较
 * 整数和浮点数不相等（1 != 1.0），布尔值和数字不相等（true != 1），
 * 数组按顺序逐项比较，对象按键逐项比较。
 */
bool strict_equal(const nlohmann::json &a, const nlohmann::json &b);

/**
 * @brief SQL 题评测脚本的输出
 */
struct query_payload {
    std::vector<std::string> user_columns;
    nlohmann::json user_rows = nlohmann::json::array();
    std::vector<std::string> reference_columns;
    nlohmann::json reference_rows = nlohmann::json::array();

    /**
     * @brief 数据库报告的错误
     */
    std::optional<std::string> error;

    /**
     * @brief 出错的语句：schema、user 或 reference
     */
    std::string error_source;
};

/**
 * @brief 检查沙箱的运行结果
 * @throw time_limit_exceeded 若运行超时
 * @throw sandbox_fault 若评测脚本以非零返回值退出
 */
void check_execution(const execution_result &result, const sandbox_limits &limits);

/**
 * @brief 解析编程题评测脚本的输出
 * 每个测试点的结果必须与测试规格中相同位置的测试点一一对应，
 * 脚本报告的通过结果会被重新比较，比较不一致时视为 payload 格式错误。
 * @throw payload_parse_error 若输出不是合法的 payload
 */
std::vector<test_case_result> parse_code_payload(const std::string &output, const code_test_spec &spec);

/**
 * @brief 解析 SQL 题评测脚本的输出
 * @throw payload_parse_error 若输出不是合法的 payload
 */
query_payload parse_query_payload(const std::string &output);

/**
 * @brief 根据各个测试点的结果生成 verdict
 */
verdict make_code_verdict(const std::vector<test_case_result> &results);

/**
 * @brief 比较两次查询的列名和结果行生成 verdict
 * 结果行的顺序必须完全一致
 */
verdict make_query_verdict(const query_payload &payload);

/**
 * @brief 编程题：检查运行结果、解析输出并生成 verdict
 */
verdict normalize_code(const execution_result &result, const sandbox_limits &limits, const code_test_spec &spec);

/**
 * @brief SQL 题：检查运行结果、解析输出并生成 verdict
 */
verdict normalize_query(const execution_result &result, const sandbox_limits &limits);

/**
 * @brief 评测选择题
 * @throw invalid_submission 若答案不是数字或者越界
 */
verdict judge_choice(const submission &submit, const choice_test_spec &spec);

}  // namespace quizjudge
