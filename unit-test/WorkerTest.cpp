#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/environment.hpp"
#include "worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace quizjudge;
using namespace nlohmann;

class WorkerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static json choice_request(const json &answer, int correct_index, const string &sub_id) {
        return {{"submission", {{"language", "choice"}, {"answer", answer}, {"prob_id", "7"}, {"sub_id", sub_id}}},
                {"test_spec", {{"options", {"3", "4", "5"}}, {"correct_index", correct_index}}}};
    }
};

TEST_F(WorkerTest, ParseSingleRequest) {
    auto requests = parse_requests(choice_request(1, 1, "1"));
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(requests[0].parse_error.empty());
    ASSERT_TRUE(requests[0].spec);
    EXPECT_EQ(requests[0].spec->language(), language::CHOICE);
    EXPECT_EQ(requests[0].submit.answer, "1");
    EXPECT_EQ(requests[0].submit.sub_id, "1");
}

TEST_F(WorkerTest, ParseCodeRequest) {
    json j = json::parse(R"({
        "submission": {"language": "python", "source": "def f(x):\n    return x\n", "prob_id": 3},
        "test_spec": {"test_cases": [{"input_args": [1], "expected_output": 1}, {"name": "edge", "input_args": [[]], "expected_output": []}]}
    })");
    auto request = parse_request(j);
    ASSERT_TRUE(request.spec);
    EXPECT_EQ(request.submit.lang, language::CODE);
    EXPECT_EQ(request.submit.prob_id, "3");

    auto &spec = dynamic_cast<const code_test_spec &>(*request.spec);
    ASSERT_EQ(spec.test_cases.size(), 2u);
    EXPECT_EQ(spec.test_cases[0].name, "Test 1");
    EXPECT_EQ(spec.test_cases[1].name, "edge");
    EXPECT_JSON_EQ(spec.test_cases[1].input_args, json::parse("[[]]"));
}

TEST_F(WorkerTest, MalformedRequest) {
    json j = json::parse(R"([
        {"submission": {"language": "fortran"}, "test_spec": {}},
        {"submission": {"language": "code", "sub_id": "9"}, "test_spec": {"test_cases": [{"input_args": 3, "expected_output": 3}]}},
        {"submission": {"language": "query", "source": "SELECT 1"}}
    ])");
    auto requests = parse_requests(j);
    ASSERT_EQ(requests.size(), 3u);
    for (auto &request : requests) {
        EXPECT_FALSE(request.spec);
        EXPECT_FALSE(request.parse_error.empty());
    }

    path root = make_scratch_dir("worker-malformed");
    workspace_manager workspaces(root);
    harness_generator generator(SCRIPT_DIR);
    scripted_runner runner(make_result("[]"));
    evaluator eval(workspaces, runner, generator);

    verdict v = evaluate_request(eval, requests[1]);
    EXPECT_EQ(v.status, status::ERROR);
    EXPECT_EQ(v.fault, judge_fault::INVALID_SUBMISSION);
    EXPECT_EQ(v.sub_id, "9");
    EXPECT_TRUE(runner.workspace_ids().empty());
}

TEST_F(WorkerTest, BatchPreservesOrder) {
    json j = json::array();
    for (int i = 0; i < 20; ++i)
        j.push_back(choice_request(i % 3, 1, to_string(i)));
    j.push_back(choice_request("abc", 1, "bad"));
    auto requests = parse_requests(j);

    path root = make_scratch_dir("worker-batch");
    workspace_manager workspaces(root);
    harness_generator generator(SCRIPT_DIR);
    scripted_runner runner(make_result("[]"));
    evaluator eval(workspaces, runner, generator);

    auto results = evaluate_batch(eval, requests, 4);
    ASSERT_EQ(results.size(), requests.size());
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].sub_id, to_string(i));
        EXPECT_EQ(results[i].status, i % 3 == 1 ? status::CORRECT : status::INCORRECT) << "request " << i;
    }
    EXPECT_EQ(results.back().sub_id, "bad");
    EXPECT_EQ(results.back().fault, judge_fault::INVALID_SUBMISSION);
    EXPECT_JSON_EQ(results.back().report, json::parse(R"({"type": "error", "message": "Invalid answer format."})"));
}

TEST_F(WorkerTest, EmptyBatch) {
    path root = make_scratch_dir("worker-empty");
    workspace_manager workspaces(root);
    harness_generator generator(SCRIPT_DIR);
    scripted_runner runner(make_result("[]"));
    evaluator eval(workspaces, runner, generator);

    EXPECT_TRUE(evaluate_batch(eval, {}, 4).empty());
}
