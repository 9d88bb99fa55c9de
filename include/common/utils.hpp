#pragma once

#include <chrono>
#include <string>

namespace quizjudge {

/**
 * @brief 读取环境变量
 * @return 环境变量的值，不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 从构造时刻开始计时的单调时钟，用于沙箱的时钟时间限制
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace quizjudge
