#include "harness/harness.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <nlohmann/json.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace quizjudge {
using namespace std;
using namespace nlohmann;

const char *DEFAULT_CALLABLE = "user_function";

static const string ENTRY_FILE = "harness.py";
static const string SOURCE_FILE = "user_code.py";
static const string CASES_FILE = "test_cases.json";
static const string SCHEMA_FILE = "schema.sql";
static const string USER_QUERY_FILE = "user_query.sql";
static const string REFERENCE_QUERY_FILE = "reference_query.sql";

string discover_callable(const string &source) {
    static const regex def_matcher(R"(def\s+([A-Za-z_][A-Za-z0-9_]*)\s*\()");
    smatch matches;
    if (regex_search(source, matches, def_matcher))
        return matches[1].str();
    return DEFAULT_CALLABLE;
}

string render_template(const string &tmpl, const map<string, string> &vars) {
    string result = tmpl;
    for (auto &[name, value] : vars)
        boost::algorithm::replace_all(result, "{{" + name + "}}", value);
    return result;
}

harness_generator::harness_generator(const filesystem::path &template_dir)
    : template_dir(template_dir) {}

string harness_generator::load_template(const string &name) const {
    auto path = template_dir / name;
    if (!filesystem::is_regular_file(path))
        throw asset_missing_error("Harness template " + path.string() + " does not exist");
    try {
        return read_file_content(path);
    } catch (system_error &ex) {
        throw asset_missing_error("Unable to read harness template " + path.string() + ": " + ex.what());
    }
}

/**
 * @brief 评测脚本使用的解释器参数
 * -I 不读取 PYTHON* 环境变量和用户 site-packages，-B 不在工作目录中写入字节码
 */
static vector<string> python_command() {
    return {"python3", "-I", "-B", ENTRY_FILE};
}

harness harness_generator::generate(const submission &submit, const code_test_spec &spec) const {
    harness h;
    h.callable = discover_callable(submit.source);

    json cases = json::array();
    for (auto &testcase : spec.test_cases)
        cases.push_back({{"name", testcase.name},
                         {"input_args", testcase.input_args},
                         {"expected_output", testcase.expected_output}});

    h.files[ENTRY_FILE] = render_template(load_template("code_harness.py"),
                                          {{"source_file", SOURCE_FILE},
                                           {"cases_file", CASES_FILE},
                                           {"callable", h.callable}});
    h.files[SOURCE_FILE] = submit.source;
    h.files[CASES_FILE] = cases.dump(2, ' ', true);
    h.command = python_command();
    return h;
}

harness harness_generator::generate(const submission &submit, const query_test_spec &spec) const {
    harness h;
    h.files[ENTRY_FILE] = render_template(load_template("query_harness.py"),
                                          {{"schema_file", SCHEMA_FILE},
                                           {"user_query_file", USER_QUERY_FILE},
                                           {"reference_query_file", REFERENCE_QUERY_FILE}});
    h.files[SCHEMA_FILE] = spec.schema;
    h.files[USER_QUERY_FILE] = submit.source;
    h.files[REFERENCE_QUERY_FILE] = spec.reference_query;
    h.command = python_command();
    return h;
}

}  // namespace quizjudge
