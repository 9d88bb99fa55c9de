#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace quizjudge {

/**
 * @brief 多个评测线程共享的阻塞队列
 * 批量评测时生产者一次性放入所有请求序号，再为每个 worker 放入一个结束标记
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 取出队头元素，队列为空时阻塞
     */
    T pop() {
        std::unique_lock<std::mutex> lock(mut);
        cond.wait(lock, [this] { return !q.empty(); });
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mut);
            q.push(std::move(value));
        }
        cond.notify_one();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace quizjudge
