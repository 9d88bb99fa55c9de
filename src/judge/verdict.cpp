#include "judge/verdict.hpp"
#include <fmt/core.h>
#include <sstream>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace quizjudge {
using namespace std;
using namespace nlohmann;

string sanitize_text(const string &text) {
    if (utf8_check_is_valid(text)) return text;
    string result;
    result.reserve(text.size());
    for (size_t pos = 0; pos < text.size();) {
        size_t length = utf8_sequence_length(text, pos);
        if (length) {
            result.append(text, pos, length);
            pos += length;
        } else {
            result.push_back('?');
            ++pos;
        }
    }
    return result;
}

void to_json(json &j, const test_case_result &result) {
    j = {{"name", result.name},
         {"input", result.input},
         {"expected", result.expected},
         {"actual", result.actual ? *result.actual : json()},
         {"passed", result.passed},
         {"error", result.error ? json(*result.error) : json()}};
}

void to_json(json &j, const verdict &v) {
    j = {{"status", get_name(v.status)},
         {"fault", get_name(v.fault)},
         {"passed_all", v.passed_all},
         {"report", v.report},
         {"raw_error", v.raw_error ? json(*v.raw_error) : json()},
         {"category", v.category},
         {"prob_id", v.prob_id},
         {"sub_id", v.sub_id}};
}

verdict make_fault_verdict(judge_fault fault, const string &message, const optional<string> &raw_error) {
    verdict v;
    v.fault = fault;
    v.status = status_of(fault);
    v.passed_all = false;
    v.report = {{"type", "error"}, {"message", sanitize_text(message)}};
    if (raw_error) v.raw_error = sanitize_text(*raw_error);
    return v;
}

static string value_text(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static void render_code(ostringstream &os, const json &report) {
    for (auto &c : get_value_def<json>(report, json::array(), "cases")) {
        bool passed = get_value_def<bool>(c, false, "passed");
        bool has_error = exists(c, "error");
        os << fmt::format("{}: {}", get_value_def<string>(c, "", "name"), passed ? "Passed" : "Failed") << endl;
        os << fmt::format("  Input: {}, Expected: {}, Got: {}",
                          value_text(access_optional(c, "input")),
                          value_text(access_optional(c, "expected")),
                          has_error ? string("Error") : value_text(access_optional(c, "actual")))
           << endl;
        if (has_error)
            os << "  Error during this test: " << get_value_def<string>(c, "", "error") << endl;
    }
}

static void render_query(ostringstream &os, const json &report) {
    auto columns = get_value_def<json>(report, json::array(), "columns");
    auto rows = get_value_def<json>(report, json::array(), "rows");
    os << "Your Output:" << endl;
    if (rows.empty()) {
        os << "Your query returned no results." << endl;
        return;
    }
    string header;
    for (auto &col : columns) {
        if (!header.empty()) header += " | ";
        header += col.is_string() ? col.get<string>() : value_text(col);
    }
    os << header << endl;
    for (auto &row : rows) {
        string line;
        for (auto &val : row) {
            if (!line.empty()) line += " | ";
            line += val.is_string() ? val.get<string>() : value_text(val);
        }
        os << line << endl;
    }
}

string render_report(const verdict &v) {
    ostringstream os;
    string type = get_value_def<string>(v.report, "error", "type");
    os << "Status: " << get_display_message(v.status);
    if (v.fault != judge_fault::NONE)
        os << " (" << get_display_message(v.fault) << ")";
    os << endl;

    if (type == "code") {
        render_code(os, v.report);
    } else if (type == "query") {
        render_query(os, v.report);
    } else if (type == "choice") {
        if (exists(v.report, "correct_option"))
            os << "The correct answer was: '" << get_value<string>(v.report, "correct_option") << "'" << endl;
    }

    string message = get_value_def<string>(v.report, "", "message");
    if (!message.empty()) os << message << endl;
    if (v.raw_error && !v.raw_error->empty())
        os << v.raw_error.value() << endl;
    return os.str();
}

}  // namespace quizjudge
