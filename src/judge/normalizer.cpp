#include "judge/normalizer.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace quizjudge {
using namespace std;
using namespace nlohmann;

bool strict_equal(const json &a, const json &b) {
    if (a.is_boolean() || b.is_boolean())
        return a.is_boolean() && b.is_boolean() && a.get<bool>() == b.get<bool>();

    // 解析得到的非负整数是 number_unsigned，程序构造的整数是 number_integer，二者属于同一类
    if (a.is_number_integer() && b.is_number_integer()) {
        if (a.is_number_unsigned() && b.is_number_unsigned())
            return a.get<uint64_t>() == b.get<uint64_t>();
        if (a.is_number_unsigned() || b.is_number_unsigned()) {
            const json &u = a.is_number_unsigned() ? a : b;
            const json &s = a.is_number_unsigned() ? b : a;
            int64_t value = s.get<int64_t>();
            return value >= 0 && (uint64_t)value == u.get<uint64_t>();
        }
        return a.get<int64_t>() == b.get<int64_t>();
    }
    if (a.is_number_float() && b.is_number_float())
        return a.get<double>() == b.get<double>();
    if (a.is_string() && b.is_string())
        return a.get_ref<const string &>() == b.get_ref<const string &>();
    if (a.is_null() || b.is_null())
        return a.is_null() && b.is_null();
    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i)
            if (!strict_equal(a[i], b[i])) return false;
        return true;
    }
    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto &[key, value] : a.items()) {
            auto it = b.find(key);
            if (it == b.end() || !strict_equal(value, *it)) return false;
        }
        return true;
    }
    return false;
}

void check_execution(const execution_result &result, const sandbox_limits &limits) {
    if (result.timed_out)
        throw time_limit_exceeded(fmt::format("Execution timed out ({} seconds)", limits.wall_time_limit),
                                  result.error.empty() ? result.output : result.error);
    if (result.exitcode != 0)
        throw sandbox_fault(fmt::format("Error during code execution (Return Code: {})", result.exitcode),
                            result.exitcode,
                            result.error.empty() ? result.output : result.error);
}

static json parse_payload(const string &output) {
    try {
        return json::parse(output);
    } catch (json::parse_error &ex) {
        throw payload_parse_error(fmt::format("Could not parse test output: {}", ex.what()), output);
    }
}

vector<test_case_result> parse_code_payload(const string &output, const code_test_spec &spec) {
    json payload = parse_payload(output);
    auto malformed = [&](const string &message) {
        return payload_parse_error(message, output);
    };

    if (!payload.is_array())
        throw malformed("Test output is not a list of results");
    if (payload.size() != spec.test_cases.size())
        throw malformed(fmt::format("Test output has {} results, but there are {} test cases", payload.size(), spec.test_cases.size()));

    vector<test_case_result> results;
    for (size_t i = 0; i < payload.size(); ++i) {
        const json &entry = payload[i];
        const code_test_case &testcase = spec.test_cases[i];
        if (!entry.is_object())
            throw malformed(fmt::format("Result #{} is not an object", i + 1));
        for (const char *key : {"name", "input", "expected", "actual", "passed", "error"})
            if (!entry.count(key))
                throw malformed(fmt::format("Result #{} does not have field {}", i + 1, key));

        test_case_result result;
        if (!entry.at("name").is_string() || entry.at("name").get<string>() != testcase.name)
            throw malformed(fmt::format("Result #{} does not belong to test case {}", i + 1, testcase.name));
        if (!strict_equal(entry.at("input"), testcase.input_args) || !strict_equal(entry.at("expected"), testcase.expected_output))
            throw malformed(fmt::format("Result #{} does not echo the input of test case {}", i + 1, testcase.name));
        if (!entry.at("passed").is_boolean())
            throw malformed(fmt::format("Result #{} has non-boolean passed field", i + 1));

        result.name = testcase.name;
        result.input = testcase.input_args;
        result.expected = testcase.expected_output;
        bool claimed = entry.at("passed").get<bool>();

        const json &error = entry.at("error");
        if (!error.is_null()) {
            if (!error.is_string())
                throw malformed(fmt::format("Result #{} has non-string error field", i + 1));
            if (claimed)
                throw malformed(fmt::format("Result #{} failed with an error but is reported as passed", i + 1));
            result.error = error.get<string>();
            result.passed = false;
        } else {
            result.actual = entry.at("actual");
            bool recomputed = strict_equal(*result.actual, testcase.expected_output);
            if (claimed && !recomputed)
                throw malformed(fmt::format("Result #{} is reported as passed but its value differs from the expected output", i + 1));
            result.passed = claimed && recomputed;
        }
        results.push_back(move(result));
    }
    return results;
}

query_payload parse_query_payload(const string &output) {
    json payload = parse_payload(output);
    if (!payload.is_object())
        throw payload_parse_error("Query output is not an object", output);

    query_payload result;
    try {
        result.user_columns = payload.at("user_cols").get<vector<string>>();
        result.user_rows = payload.at("user_rows");
        result.reference_columns = payload.at("reference_cols").get<vector<string>>();
        result.reference_rows = payload.at("reference_rows");
        const json &error = payload.at("error");
        if (!error.is_null()) result.error = error.get<string>();
        const json &source = payload.at("error_source");
        if (!source.is_null()) result.error_source = source.get<string>();
    } catch (json::exception &ex) {
        throw payload_parse_error(fmt::format("Malformed query output: {}", ex.what()), output);
    }

    for (const json *rows : {&result.user_rows, &result.reference_rows}) {
        if (!rows->is_array())
            throw payload_parse_error("Query rows are not a list", output);
        for (auto &row : *rows)
            if (!row.is_array())
                throw payload_parse_error("Query row is not a list", output);
    }
    if (result.error && result.error_source.empty())
        result.error_source = "user";
    return result;
}

verdict make_code_verdict(const vector<test_case_result> &results) {
    verdict v;
    size_t pass_cases = 0;
    for (auto &result : results)
        if (result.passed) ++pass_cases;

    v.fault = judge_fault::NONE;
    v.passed_all = pass_cases == results.size();
    v.status = v.passed_all ? status::CORRECT : status::INCORRECT;
    v.report = {{"type", "code"},
                {"message", v.passed_all ? "All tests passed!" : "Some tests failed."},
                {"pass_cases", pass_cases},
                {"total_cases", results.size()},
                {"cases", results}};
    return v;
}

static const char *error_source_label(const string &source) {
    if (source == "schema") return "Schema error";
    if (source == "reference") return "Reference query error";
    return "SQL Error";
}

verdict make_query_verdict(const query_payload &payload) {
    if (payload.error) {
        // 数据库报错时，即使结果碰巧一致也不能判为正确
        verdict v = make_fault_verdict(judge_fault::QUERY_ERROR,
                                       fmt::format("{}: {}", error_source_label(payload.error_source), *payload.error));
        v.report["error_source"] = payload.error_source;
        return v;
    }

    verdict v;
    v.fault = judge_fault::NONE;
    v.passed_all = payload.user_columns == payload.reference_columns &&
                   strict_equal(payload.user_rows, payload.reference_rows);
    v.status = v.passed_all ? status::CORRECT : status::INCORRECT;
    v.report = {{"type", "query"},
                {"message", v.passed_all ? "Correct!" : "Incorrect."},
                {"columns", payload.user_columns},
                {"rows", payload.user_rows}};
    return v;
}

verdict normalize_code(const execution_result &result, const sandbox_limits &limits, const code_test_spec &spec) {
    check_execution(result, limits);
    verdict v = make_code_verdict(parse_code_payload(result.output, spec));
    if (!result.error.empty()) v.raw_error = sanitize_text(result.error);
    return v;
}

verdict normalize_query(const execution_result &result, const sandbox_limits &limits) {
    check_execution(result, limits);
    return make_query_verdict(parse_query_payload(result.output));
}

verdict judge_choice(const submission &submit, const choice_test_spec &spec) {
    int selected;
    try {
        selected = boost::lexical_cast<int>(boost::algorithm::trim_copy(submit.answer));
    } catch (boost::bad_lexical_cast &) {
        throw invalid_submission("Invalid answer format.");
    }
    if (selected < 0 || (size_t)selected >= spec.options.size())
        throw invalid_submission(fmt::format("Selected option {} is out of range.", selected));

    verdict v;
    v.fault = judge_fault::NONE;
    v.passed_all = selected == spec.correct_index;
    v.status = v.passed_all ? status::CORRECT : status::INCORRECT;
    v.report = {{"type", "choice"},
                {"message", v.passed_all ? "Correct!" : "Incorrect."},
                {"selected_option", spec.options[selected]}};
    if (!v.passed_all && spec.correct_index >= 0 && (size_t)spec.correct_index < spec.options.size())
        v.report["correct_option"] = spec.options[spec.correct_index];
    return v;
}

}  // namespace quizjudge
