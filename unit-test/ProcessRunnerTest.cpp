#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/evaluator.hpp"
#include "sandbox/process.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace quizjudge;
using namespace nlohmann;

class ProcessRunnerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        saved_code_limits = CODE_LIMITS;
        saved_query_limits = QUERY_LIMITS;
    }

    void TearDown() override {
        CODE_LIMITS = saved_code_limits;
        QUERY_LIMITS = saved_query_limits;
    }

    static sandbox_limits short_limits(double seconds) {
        sandbox_limits limits;
        limits.wall_time_limit = seconds;
        return limits;
    }

    sandbox_limits saved_code_limits, saved_query_limits;
};

TEST_F(ProcessRunnerTest, CaptureOutputSeparately) {
    workspace_manager workspaces(make_scratch_dir("process-output"));
    scoped_workspace ws(workspaces);
    process_runner runner;

    auto result = runner.run(ws.get(), {"sh", "-c", "echo payload; echo diagnostics >&2; exit 3"}, short_limits(5));
    EXPECT_EQ(result.output, "payload\n");
    EXPECT_EQ(result.error, "diagnostics\n");
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.truncated);
}

TEST_F(ProcessRunnerTest, RunsInWorkspace) {
    workspace_manager workspaces(make_scratch_dir("process-cwd"));
    scoped_workspace ws(workspaces);
    workspaces.materialize(ws.get(), {{"data.txt", "hello"}});
    process_runner runner;

    auto result = runner.run(ws.get(), {"cat", "data.txt"}, short_limits(5));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.output, "hello");
}

TEST_F(ProcessRunnerTest, KillOnTimeout) {
    workspace_manager workspaces(make_scratch_dir("process-timeout"));
    scoped_workspace ws(workspaces);
    process_runner runner;

    auto result = runner.run(ws.get(), {"sh", "-c", "echo started; sleep 30"}, short_limits(0.5));
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.exitcode, 0);
    EXPECT_EQ(result.output, "started\n");
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(ProcessRunnerTest, TruncateOutput) {
    workspace_manager workspaces(make_scratch_dir("process-truncate"));
    scoped_workspace ws(workspaces);
    process_runner runner;
    sandbox_limits limits = short_limits(5);
    limits.output_limit = 16;

    auto result = runner.run(ws.get(), {"sh", "-c", "yes | head -c 100000"}, limits);
    EXPECT_EQ(result.output.size(), 16u);
    EXPECT_TRUE(result.truncated);
}

TEST_F(ProcessRunnerTest, MissingInterpreter) {
    workspace_manager workspaces(make_scratch_dir("process-missing"));
    scoped_workspace ws(workspaces);
    process_runner runner("/nonexistent/python3");

    try {
        runner.run(ws.get(), {"python3", "harness.py"}, short_limits(5));
        FAIL() << "run should throw";
    } catch (sandbox_unavailable_error &ex) {
        EXPECT_EQ(ex.fault(), judge_fault::SANDBOX_UNAVAILABLE);
    }
}

class ProcessEvaluationTest : public ProcessRunnerTest {
protected:
    void SetUp() override {
        ProcessRunnerTest::SetUp();
        if (!python_available()) GTEST_SKIP() << "python3 is not available";
    }

    static submission code_submission(const string &source) {
        submission submit;
        submit.lang = language::CODE;
        submit.source = source;
        return submit;
    }

    static code_test_spec make_spec(const json &cases) {
        code_test_spec spec;
        for (size_t i = 0; i < cases.size(); ++i) {
            code_test_case testcase;
            testcase.name = "Test " + to_string(i + 1);
            testcase.input_args = cases[i].at(0);
            testcase.expected_output = cases[i].at(1);
            spec.test_cases.push_back(testcase);
        }
        return spec;
    }
};

TEST_F(ProcessEvaluationTest, CodeAllPassed) {
    path root = make_scratch_dir("process-eval-correct");
    workspace_manager workspaces(root);
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    verdict v = eval.evaluate(code_submission("def double(x):\n    print('debug', x)\n    return x * 2\n"),
                              make_spec(json::parse("[[[3], 6], [[0], 0], [[-5], -10]]")));
    EXPECT_EQ(v.status, status::CORRECT) << render_report(v);
    EXPECT_TRUE(v.passed_all);
    EXPECT_EQ(v.report["pass_cases"], 3);
    ASSERT_EQ(v.report["cases"].size(), 3u);
    EXPECT_EQ(v.report["cases"][2]["name"], "Test 3");
    EXPECT_JSON_EQ(v.report["cases"][2]["actual"], json(-10));
    // 选手的输出不会混入 payload
    ASSERT_TRUE(v.raw_error.has_value());
    EXPECT_NE(v.raw_error->find("debug 3"), string::npos);
    EXPECT_EQ(count_entries(root), 0u);
}

TEST_F(ProcessEvaluationTest, IntegerDoesNotEqualFloat) {
    workspace_manager workspaces(make_scratch_dir("process-eval-strict"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    verdict v = eval.evaluate(code_submission("def one():\n    return 1\n"),
                              make_spec(json::parse("[[[], 1.0]]")));
    EXPECT_EQ(v.status, status::INCORRECT) << render_report(v);
    EXPECT_FALSE(v.passed_all);
    EXPECT_JSON_EQ(v.report["cases"][0]["actual"], json(1));

    verdict b = eval.evaluate(code_submission("def yes():\n    return True\n"),
                              make_spec(json::parse("[[[], 1]]")));
    EXPECT_EQ(b.status, status::INCORRECT) << render_report(b);
}

TEST_F(ProcessEvaluationTest, TupleEqualsList) {
    workspace_manager workspaces(make_scratch_dir("process-eval-tuple"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    verdict v = eval.evaluate(code_submission("def pair(a, b):\n    return (b, a)\n"),
                              make_spec(json::parse("[[[1, \"x\"], [\"x\", 1]]]")));
    EXPECT_EQ(v.status, status::CORRECT) << render_report(v);
}

TEST_F(ProcessEvaluationTest, ErrorScopedToTestCase) {
    workspace_manager workspaces(make_scratch_dir("process-eval-error"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    verdict v = eval.evaluate(code_submission("def inverse(x):\n    return 1 / x\n"),
                              make_spec(json::parse("[[[0], 0], [[2], 0.5]]")));
    EXPECT_EQ(v.status, status::INCORRECT) << render_report(v);
    EXPECT_EQ(v.fault, judge_fault::NONE);
    auto &cases = v.report["cases"];
    EXPECT_FALSE(cases[0]["passed"].get<bool>());
    EXPECT_TRUE(cases[0]["actual"].is_null());
    EXPECT_NE(cases[0]["error"].get<string>().find("ZeroDivisionError"), string::npos);
    EXPECT_TRUE(cases[1]["passed"].get<bool>());
}

TEST_F(ProcessEvaluationTest, SyntaxErrorIsIncorrect) {
    workspace_manager workspaces(make_scratch_dir("process-eval-syntax"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    verdict v = eval.evaluate(code_submission("def broken(x)\n    return x\n"),
                              make_spec(json::parse("[[[1], 1]]")));
    EXPECT_EQ(v.status, status::INCORRECT) << render_report(v);
    EXPECT_EQ(v.fault, judge_fault::SANDBOX_FAULT);
    ASSERT_TRUE(v.raw_error.has_value());
    EXPECT_NE(v.raw_error->find("SyntaxError"), string::npos);
}

TEST_F(ProcessEvaluationTest, InfiniteLoopTimesOut) {
    path root = make_scratch_dir("process-eval-timeout");
    workspace_manager workspaces(root);
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);
    CODE_LIMITS.wall_time_limit = 1;

    verdict v = eval.evaluate(code_submission("def spin(x):\n    while True:\n        pass\n"),
                              make_spec(json::parse("[[[1], 1]]")));
    EXPECT_EQ(v.status, status::ERROR) << render_report(v);
    EXPECT_EQ(v.fault, judge_fault::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(v.passed_all);
    EXPECT_EQ(count_entries(root), 0u);
}

TEST_F(ProcessEvaluationTest, QueryRowOrderMatters) {
    workspace_manager workspaces(make_scratch_dir("process-eval-query"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    query_test_spec spec;
    spec.schema = "CREATE TABLE users (id INTEGER, name TEXT);"
                  "INSERT INTO users VALUES (1, 'Bob'), (2, 'Alice');";
    spec.reference_query = "SELECT name FROM users ORDER BY name";

    submission submit;
    submit.lang = language::QUERY;
    submit.source = "SELECT name FROM users ORDER BY id";
    verdict wrong = eval.evaluate(submit, spec);
    EXPECT_EQ(wrong.status, status::INCORRECT) << render_report(wrong);
    EXPECT_FALSE(wrong.passed_all);
    EXPECT_JSON_EQ(wrong.report["rows"], json::parse(R"([["Bob"], ["Alice"]])"));

    submit.source = "SELECT name FROM users ORDER BY name ASC";
    verdict right = eval.evaluate(submit, spec);
    EXPECT_EQ(right.status, status::CORRECT) << render_report(right);
    EXPECT_JSON_EQ(right.report["columns"], json::parse(R"(["name"])"));
}

TEST_F(ProcessEvaluationTest, QueryErrorAndIsolation) {
    workspace_manager workspaces(make_scratch_dir("process-eval-query-error"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    query_test_spec spec;
    spec.schema = "CREATE TABLE users (name TEXT); INSERT INTO users VALUES ('Alice');";
    spec.reference_query = "SELECT name FROM users";

    submission submit;
    submit.lang = language::QUERY;
    submit.source = "SELECT nme FROM users";
    verdict error = eval.evaluate(submit, spec);
    EXPECT_EQ(error.status, status::ERROR) << render_report(error);
    EXPECT_EQ(error.fault, judge_fault::QUERY_ERROR);
    EXPECT_EQ(error.report["error_source"], "user");

    // 选手语句修改数据不会影响标准查询
    submit.source = "DELETE FROM users";
    verdict isolated = eval.evaluate(submit, spec);
    EXPECT_EQ(isolated.status, status::INCORRECT) << render_report(isolated);
}

TEST_F(ProcessEvaluationTest, QueryEmptyResult) {
    workspace_manager workspaces(make_scratch_dir("process-eval-query-empty"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    query_test_spec spec;
    spec.schema = "CREATE TABLE users (name TEXT);";
    spec.reference_query = "SELECT name FROM users";

    submission submit;
    submit.lang = language::QUERY;
    submit.source = "SELECT name FROM users WHERE name = 'nobody'";
    verdict v = eval.evaluate(submit, spec);
    EXPECT_EQ(v.status, status::CORRECT) << render_report(v);
    EXPECT_NE(render_report(v).find("Your query returned no results."), string::npos);
}

TEST_F(ProcessEvaluationTest, QueryBlobAndInfinityAreNotText) {
    workspace_manager workspaces(make_scratch_dir("process-eval-query-types"));
    harness_generator generator(SCRIPT_DIR);
    process_runner runner;
    evaluator eval(workspaces, runner, generator);

    query_test_spec spec;
    spec.schema = "CREATE TABLE t (b BLOB, r REAL); INSERT INTO t VALUES (x'abcd', 1e999);";
    spec.reference_query = "SELECT b FROM t";

    submission submit;
    submit.lang = language::QUERY;
    submit.source = "SELECT 'abcd' AS b";
    verdict text_for_blob = eval.evaluate(submit, spec);
    EXPECT_EQ(text_for_blob.status, status::INCORRECT) << render_report(text_for_blob);
    EXPECT_FALSE(text_for_blob.passed_all);

    submit.source = "SELECT b FROM t";
    verdict blob = eval.evaluate(submit, spec);
    EXPECT_EQ(blob.status, status::CORRECT) << render_report(blob);
    EXPECT_JSON_EQ(blob.report["rows"], json::parse(R"([[{"$blob": "abcd"}]])"));

    spec.reference_query = "SELECT r FROM t";
    submit.source = "SELECT 'inf' AS r";
    verdict text_for_inf = eval.evaluate(submit, spec);
    EXPECT_EQ(text_for_inf.status, status::INCORRECT) << render_report(text_for_inf);

    submit.source = "SELECT r FROM t";
    verdict inf = eval.evaluate(submit, spec);
    EXPECT_EQ(inf.status, status::CORRECT) << render_report(inf);
    EXPECT_JSON_EQ(inf.report["rows"], json::parse(R"([[{"$float": "inf"}]])"));
}
