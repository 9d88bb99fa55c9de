#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "harness/harness.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace quizjudge;
using namespace nlohmann;

class HarnessTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static code_test_spec make_code_spec() {
        code_test_spec spec;
        code_test_case a;
        a.name = "Test 1";
        a.input_args = {3};
        a.expected_output = 6;
        spec.test_cases.push_back(a);
        code_test_case b;
        b.name = "negative";
        b.input_args = {-2};
        b.expected_output = -4;
        spec.test_cases.push_back(b);
        return spec;
    }
};

TEST_F(HarnessTest, DiscoverCallable) {
    EXPECT_EQ(discover_callable("def double(x):\n    return x * 2\n"), "double");
    EXPECT_EQ(discover_callable("import math\n\ndef  area (r):\n    return math.pi * r * r\n\ndef other():\n    pass\n"), "area");
    EXPECT_EQ(discover_callable("x = 1\n"), DEFAULT_CALLABLE);
    EXPECT_EQ(discover_callable(""), "user_function");
}

TEST_F(HarnessTest, RenderTemplate) {
    EXPECT_EQ(render_template("CALL = \"{{callable}}\"\nFILE = \"{{file}}\" {{callable}}",
                              {{"callable", "double"}, {"file", "a.py"}}),
              "CALL = \"double\"\nFILE = \"a.py\" double");
    EXPECT_EQ(render_template("{{unknown}}", {}), "{{unknown}}");
}

TEST_F(HarnessTest, GenerateCodeHarness) {
    harness_generator generator(SCRIPT_DIR);
    submission submit;
    submit.lang = language::CODE;
    submit.source = "def double(x):\n    return x * 2  # \"\"\" {{callable}}\n";

    harness h = generator.generate(submit, make_code_spec());
    EXPECT_EQ(h.callable, "double");
    ASSERT_TRUE(h.files.count("harness.py"));
    ASSERT_TRUE(h.files.count("user_code.py"));
    ASSERT_TRUE(h.files.count("test_cases.json"));
    EXPECT_EQ(h.files.at("user_code.py"), submit.source);

    // 选手代码不会被拼接进评测脚本
    const string &entry = h.files.at("harness.py");
    EXPECT_EQ(entry.find("return x * 2"), string::npos);
    EXPECT_NE(entry.find("CALLABLE = \"double\""), string::npos);
    EXPECT_EQ(entry.find("{{"), string::npos);

    json cases = json::parse(h.files.at("test_cases.json"));
    EXPECT_JSON_EQ(cases, json::parse(R"([
        {"name": "Test 1", "input_args": [3], "expected_output": 6},
        {"name": "negative", "input_args": [-2], "expected_output": -4}
    ])"));

    ASSERT_FALSE(h.command.empty());
    EXPECT_EQ(h.command.front(), "python3");
    EXPECT_EQ(h.command.back(), "harness.py");
}

TEST_F(HarnessTest, GenerateIsDeterministic) {
    harness_generator generator(SCRIPT_DIR);
    submission submit;
    submit.lang = language::CODE;
    submit.source = "def f(x):\n    return x\n";
    auto spec = make_code_spec();

    harness a = generator.generate(submit, spec);
    harness b = generator.generate(submit, spec);
    EXPECT_EQ(a.files, b.files);
    EXPECT_EQ(a.command, b.command);
}

TEST_F(HarnessTest, GenerateQueryHarness) {
    harness_generator generator(SCRIPT_DIR);
    submission submit;
    submit.lang = language::QUERY;
    submit.source = "SELECT name FROM users";
    query_test_spec spec;
    spec.schema = "CREATE TABLE users (name TEXT);";
    spec.reference_query = "SELECT name FROM users ORDER BY name";

    harness h = generator.generate(submit, spec);
    EXPECT_EQ(h.files.at("schema.sql"), spec.schema);
    EXPECT_EQ(h.files.at("user_query.sql"), submit.source);
    EXPECT_EQ(h.files.at("reference_query.sql"), spec.reference_query);
    EXPECT_EQ(h.files.at("harness.py").find("SELECT"), string::npos);
    EXPECT_TRUE(h.callable.empty());
}

TEST_F(HarnessTest, MissingTemplate) {
    harness_generator generator(SCRATCH_DIR / "no-such-templates");
    submission submit;
    submit.lang = language::CODE;
    try {
        generator.generate(submit, make_code_spec());
        FAIL() << "generate should throw";
    } catch (asset_missing_error &ex) {
        EXPECT_EQ(ex.fault(), judge_fault::ASSET_MISSING);
    }
}
