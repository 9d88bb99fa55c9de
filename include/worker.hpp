#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/evaluator.hpp"

/**
 * 批量评测相关函数
 * 命令行一次可以提交多个评测请求，请求的序号被放入任务队列，
 * 每个 worker 线程不断从队列中取出序号进行评测，并把 verdict 写回相同序号的位置，
 * 因此输出的 verdict 顺序与输入的请求顺序一致。
 * 每个 worker 取到空序号时退出。
 */
namespace quizjudge {

/**
 * @brief 一个评测请求
 * @code{.json}
 * {
 *   "submission": {"language": "choice", "answer": 1},
 *   "test_spec": {"options": ["3", "4", "5"], "correct_index": 1}
 * }
 * @endcode
 */
struct evaluation_request {
    submission submit;

    /**
     * @brief 测试规格，请求无法解析时为空
     */
    std::unique_ptr<test_spec> spec;

    /**
     * @brief 请求无法解析时的错误信息
     */
    std::string parse_error;
};

/**
 * @brief 解析一个评测请求
 * 解析失败时不抛出异常，而是记录在 parse_error 中，以便批量评测时其他请求不受影响
 */
evaluation_request parse_request(const nlohmann::json &j);

/**
 * @brief 解析评测请求列表
 * @param j 单个请求对象，或者请求数组
 */
std::vector<evaluation_request> parse_requests(const nlohmann::json &j);

/**
 * @brief 评测一个请求，无法解析的请求得到 INVALID_SUBMISSION 的 verdict
 */
verdict evaluate_request(const evaluator &eval, const evaluation_request &request);

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，只用于日志
 * @param task_queue 请求序号队列，取到空序号时线程退出
 * @param requests 所有评测请求
 * @param results 评测结果，大小必须和 requests 一致
 * @return 产生的线程
 */
std::thread start_worker(size_t worker_id, const evaluator &eval, concurrent_queue<std::optional<size_t>> &task_queue,
                         const std::vector<evaluation_request> &requests, std::vector<verdict> &results);

/**
 * @brief 使用 jobs 个 worker 并发评测所有请求
 * @return 与 requests 顺序一致的评测结果
 */
std::vector<verdict> evaluate_batch(const evaluator &eval, const std::vector<evaluation_request> &requests, size_t jobs);

}  // namespace quizjudge
