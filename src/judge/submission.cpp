#include "judge/submission.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace quizjudge {
using namespace std;
using namespace nlohmann;

const char *get_name(language lang) {
    switch (lang) {
        case language::CODE:
            return "code";
        case language::QUERY:
            return "query";
        case language::CHOICE:
            return "choice";
    }
    return "unknown";
}

language parse_language(const string &name) {
    if (name == "code" || name == "python") return language::CODE;
    if (name == "query" || name == "sql") return language::QUERY;
    if (name == "choice" || name == "mcq") return language::CHOICE;
    throw invalid_submission("Unrecognized submission language " + name);
}

test_spec::~test_spec() {}

language code_test_spec::language() const {
    return language::CODE;
}

language query_test_spec::language() const {
    return language::QUERY;
}

language choice_test_spec::language() const {
    return language::CHOICE;
}

static string id_to_string(const json &j) {
    if (j.is_null()) return "";
    if (j.is_string()) return j.get<string>();
    return j.dump();
}

void from_json(const json &j, submission &submit) {
    submit.lang = parse_language(get_value<string>(j, "language"));
    submit.source = get_value_def<string>(j, "", "source");
    submit.answer = id_to_string(access_optional(j, "answer"));
    submit.category = id_to_string(access_optional(j, "category"));
    submit.prob_id = id_to_string(access_optional(j, "prob_id"));
    submit.sub_id = id_to_string(access_optional(j, "sub_id"));
}

static unique_ptr<test_spec> parse_code_spec(const json &j) {
    auto spec = make_unique<code_test_spec>();
    const json &cases = access(j, "test_cases");
    if (!cases.is_array()) throw build_invalid_argument(j, "test_cases");
    for (size_t i = 0; i < cases.size(); ++i) {
        const json &c = cases[i];
        code_test_case testcase;
        testcase.name = get_value_def<string>(c, fmt::format("Test {}", i + 1), "name");
        testcase.input_args = access(c, "input_args");
        if (!testcase.input_args.is_array()) throw build_invalid_argument(c, "input_args");
        if (!c.is_object() || !c.count("expected_output")) throw build_invalid_argument(c, "expected_output");
        testcase.expected_output = c.at("expected_output");
        spec->test_cases.push_back(move(testcase));
    }
    return spec;
}

static unique_ptr<test_spec> parse_query_spec(const json &j) {
    auto spec = make_unique<query_test_spec>();
    spec->schema = get_value_def<string>(j, "", "schema");
    spec->reference_query = get_value<string>(j, "reference_query");
    return spec;
}

static unique_ptr<test_spec> parse_choice_spec(const json &j) {
    auto spec = make_unique<choice_test_spec>();
    spec->options = get_value<vector<string>>(j, "options");
    spec->correct_index = get_value<int>(j, "correct_index");
    return spec;
}

unique_ptr<test_spec> parse_test_spec(language lang, const json &j) {
    switch (lang) {
        case language::CODE:
            return parse_code_spec(j);
        case language::QUERY:
            return parse_query_spec(j);
        case language::CHOICE:
            return parse_choice_spec(j);
    }
    throw invalid_argument("Unrecognized test spec language");
}

}  // namespace quizjudge
