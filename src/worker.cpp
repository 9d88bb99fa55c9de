#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace quizjudge {
using namespace std;
using namespace nlohmann;

evaluation_request parse_request(const json &j) {
    evaluation_request request;
    try {
        request.submit = get_value<submission>(j, "submission");
        request.spec = parse_test_spec(request.submit.lang, access(j, "test_spec"));
    } catch (judge_exception &ex) {
        request.parse_error = ex.what();
    } catch (invalid_argument &ex) {
        request.parse_error = ex.what();
    } catch (json::exception &ex) {
        request.parse_error = ex.what();
    }
    if (!request.parse_error.empty()) {
        request.spec.reset();
        LOG(WARNING) << "Malformed evaluation request: " << request.parse_error;
    }
    return request;
}

vector<evaluation_request> parse_requests(const json &j) {
    vector<evaluation_request> requests;
    if (j.is_array()) {
        for (auto &item : j) requests.push_back(parse_request(item));
    } else {
        requests.push_back(parse_request(j));
    }
    return requests;
}

verdict evaluate_request(const evaluator &eval, const evaluation_request &request) {
    if (!request.spec) {
        verdict v = make_fault_verdict(judge_fault::INVALID_SUBMISSION, "Malformed request: " + request.parse_error);
        v.category = request.submit.category;
        v.prob_id = request.submit.prob_id;
        v.sub_id = request.submit.sub_id;
        return v;
    }
    return eval.evaluate(request.submit, *request.spec);
}

static void worker_loop(size_t worker_id, const evaluator &eval, concurrent_queue<optional<size_t>> &task_queue,
                        const vector<evaluation_request> &requests, vector<verdict> &results) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        optional<size_t> index = task_queue.pop();
        if (!index) break;
        // 每个序号只会被一个 worker 取到，因此写入 results 不需要加锁
        results[*index] = evaluate_request(eval, requests[*index]);
    }
    DLOG(INFO) << "Worker " << worker_id << " exited";
}

thread start_worker(size_t worker_id, const evaluator &eval, concurrent_queue<optional<size_t>> &task_queue,
                    const vector<evaluation_request> &requests, vector<verdict> &results) {
    return thread(worker_loop, worker_id, cref(eval), ref(task_queue), cref(requests), ref(results));
}

vector<verdict> evaluate_batch(const evaluator &eval, const vector<evaluation_request> &requests, size_t jobs) {
    vector<verdict> results(requests.size());
    jobs = max<size_t>(1, min(jobs, requests.size()));

    concurrent_queue<optional<size_t>> task_queue;
    for (size_t i = 0; i < requests.size(); ++i) task_queue.push(i);
    for (size_t i = 0; i < jobs; ++i) task_queue.push(nullopt);

    vector<thread> workers;
    for (size_t i = 0; i < jobs; ++i)
        workers.push_back(start_worker(i, eval, task_queue, requests, results));
    for (auto &worker : workers) worker.join();
    return results;
}

}  // namespace quizjudge
