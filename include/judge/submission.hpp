#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * 这个头文件包含提交信息和测试规格
 * 包含：
 * 1. submission 类（表示一个选手提交，编程题、SQL 题、选择题共用）
 * 2. test_spec 类及其子类（表示出题人为一道题给定的测试规格）
 */
namespace quizjudge {

/**
 * @brief 提交类型
 */
enum class language {
    /**
     * @brief 编程题，选手提交一个 Python 函数
     */
    CODE,

    /**
     * @brief SQL 题，选手提交一条查询语句
     */
    QUERY,

    /**
     * @brief 单选题，不需要沙箱
     */
    CHOICE
};

/**
 * @brief 提交类型在 JSON 中的名称：code、query、choice
 */
const char *get_name(language lang);

/**
 * @brief 解析提交类型名称
 * @throw invalid_submission 若名称不是 code、query、choice 之一
 */
language parse_language(const std::string &name);

/**
 * @brief 一个选手提交
 * 评测核心不保存任何跨提交的状态，category、prob_id、sub_id 只用于日志和回显到 verdict 中，
 * 调用方可以用它们把 verdict 和自己的会话状态对应起来。
 */
struct submission {
    language lang = language::CODE;

    /**
     * @brief 编程题的源代码，或者 SQL 题的查询语句
     */
    std::string source;

    /**
     * @brief 选择题选手选择的选项编号，保留提交时的原文
     * 非数字、越界的选项在评测时会得到 ERROR 而不是 INCORRECT
     */
    std::string answer;

    /**
     * @brief 题目所属的题库，比如 sql_basics
     * 此项是可选项
     */
    std::string category;

    /**
     * @brief 题目 id
     * string 可以兼容一切情况
     */
    std::string prob_id;

    /**
     * @brief 提交 id
     * string 可以兼容一切情况
     */
    std::string sub_id;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << get_name(submit.lang) << ":" << submit.category << "-" << submit.prob_id << "-" << submit.sub_id << "]";
    return os;
}

/**
 * @brief 出题人给定的测试规格
 * 子类的类型必须与 language() 一致，judger 通过 dynamic_cast 取得具体的测试规格
 */
struct test_spec {
    virtual ~test_spec();

    virtual quizjudge::language language() const = 0;
};

/**
 * @brief 编程题的一个测试点
 */
struct code_test_case {
    /**
     * @brief 测试点名称，题目未给出时为 "Test <序号>"
     */
    std::string name;

    /**
     * @brief 按顺序传给被测函数的参数
     * @note 必须是 JSON 数组
     */
    nlohmann::json input_args = nlohmann::json::array();

    /**
     * @brief 被测函数的期望返回值
     * 比较时不做任何类型转换，1 和 1.0、true 和 1 均不相等
     */
    nlohmann::json expected_output;
};

struct code_test_spec : public test_spec {
    /**
     * @brief 所有测试点，评测结果的顺序与这里的顺序一致
     */
    std::vector<code_test_case> test_cases;

    quizjudge::language language() const override;
};

struct query_test_spec : public test_spec {
    /**
     * @brief 建表脚本，可以为空
     */
    std::string schema;

    /**
     * @brief 标准查询语句
     */
    std::string reference_query;

    quizjudge::language language() const override;
};

struct choice_test_spec : public test_spec {
    std::vector<std::string> options;

    int correct_index = 0;

    quizjudge::language language() const override;
};

/**
 * @brief 从请求 JSON 中读取提交
 * @code{.json}
 * {
 *   "language": "code",
 *   "source": "def double(x):\n    return x * 2\n",
 *   "category": "python_basic_problems",
 *   "prob_id": "1",
 *   "sub_id": "42"
 * }
 * @endcode
 * 选择题的 answer 可以是字符串或数字
 */
void from_json(const nlohmann::json &j, submission &submit);

/**
 * @brief 从请求 JSON 中读取测试规格
 * @param lang 测试规格对应的提交类型
 * @param j 测试规格
 * @throw std::invalid_argument 若字段缺失或者类型不正确
 */
std::unique_ptr<test_spec> parse_test_spec(language lang, const nlohmann::json &j);

}  // namespace quizjudge
