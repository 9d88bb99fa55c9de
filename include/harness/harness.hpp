#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace quizjudge {

/**
 * @brief 被测函数名的默认值，源代码中找不到函数定义时使用
 */
extern const char *DEFAULT_CALLABLE;

/**
 * @brief 在沙箱中运行的评测脚本
 * 选手代码和测试数据以独立的文件存放，评测脚本在运行时读取它们，
 * 因此选手代码中的任何内容都不会被拼接进评测脚本。
 */
struct harness {
    /**
     * @brief 需要写入工作目录的文件，键为相对路径
     */
    std::map<std::string, std::string> files;

    /**
     * @brief 在工作目录中执行的命令，第一个元素是解释器
     */
    std::vector<std::string> command;

    /**
     * @brief 编程题被测函数的名字，SQL 题为空
     */
    std::string callable;
};

/**
 * @brief 找到源代码中第一个函数定义的名字
 * @return 函数名，找不到时返回 DEFAULT_CALLABLE
 */
std::string discover_callable(const std::string &source);

/**
 * @brief 将模板中的 {{name}} 替换为 vars 中对应的值
 */
std::string render_template(const std::string &tmpl, const std::map<std::string, std::string> &vars);

/**
 * @brief 根据提交和测试规格生成评测脚本
 * 生成过程是纯函数：相同的输入总是得到相同的评测脚本
 *
 * template_dir
 * ├── code_harness.py // 编程题评测脚本模板
 * └── query_harness.py // SQL 题评测脚本模板
 */
struct harness_generator {
    explicit harness_generator(const std::filesystem::path &template_dir);

    /**
     * @throw asset_missing_error 若模板文件不存在
     */
    harness generate(const submission &submit, const code_test_spec &spec) const;

    /**
     * @throw asset_missing_error 若模板文件不存在
     */
    harness generate(const submission &submit, const query_test_spec &spec) const;

private:
    std::string load_template(const std::string &name) const;

    std::filesystem::path template_dir;
};

}  // namespace quizjudge
