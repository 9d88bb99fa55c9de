#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include "gmock/gmock.h"
#include "sandbox/container.hpp"
#include "sandbox/runner.hpp"
#include "workspace.hpp"

/**
 * 测试用的评测环境
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment();
 * 2. 用 make_scratch_dir 创建测试独占的 scratch 根目录
 * 3. 用 mock_runner 代替真实的沙箱，或者在 python_available() 时使用 process_runner
 */
namespace quizjudge {

void setup_test_environment();

/**
 * @brief 本机是否可以运行 python3，进程沙箱的端到端测试依赖它
 */
bool python_available();

/**
 * @brief 创建一个空的 scratch 根目录
 */
std::filesystem::path make_scratch_dir(const std::string &name);

/**
 * @brief 统计目录中的文件和子目录数量
 */
size_t count_entries(const std::filesystem::path &dir);

/**
 * @brief 模拟工作目录不可写，以 root 运行测试时无法通过文件权限制造这种情况
 */
struct readonly_workspace_manager : public workspace_manager {
    using workspace_manager::workspace_manager;

    void verify_writable(const workspace &ws) const override;
};

struct mock_runner : public sandbox_runner {
    MOCK_METHOD(std::string, type, (), (const, override));
    MOCK_METHOD(execution_result, run, (const workspace &, const std::vector<std::string> &, const sandbox_limits &), (const, override));
};

/**
 * @brief 不连接真实容器引擎的 container_engine，用于检查 container_runner 的调用顺序
 */
struct mock_engine : public container_engine {
    mock_engine() : container_engine("/nonexistent/docker.sock") {}

    MOCK_METHOD(void, ping, (), (const, override));
    MOCK_METHOD(bool, has_image, (const std::string &), (const, override));
    MOCK_METHOD(std::string, create_container, (const std::string &, const nlohmann::json &), (const, override));
    MOCK_METHOD(void, start_container, (const std::string &), (const, override));
    MOCK_METHOD(std::optional<int>, wait_container, (const std::string &, double), (const, override));
    MOCK_METHOD(void, kill_container, (const std::string &), (const, override));
    MOCK_METHOD(std::string, container_logs, (const std::string &, size_t, bool &), (const, override));
    MOCK_METHOD(void, remove_container, (const std::string &), (const, override));
};

/**
 * @brief 总是返回同一个运行结果的沙箱，记录每次运行时工作目录中的文件
 */
struct scripted_runner : public sandbox_runner {
    execution_result result;

    explicit scripted_runner(execution_result result);

    std::string type() const override;

    execution_result run(const workspace &ws, const std::vector<std::string> &command, const sandbox_limits &limits) const override;

    std::set<std::string> workspace_ids() const;

    std::map<std::string, std::string> last_files() const;

private:
    mutable std::mutex mut;
    mutable std::set<std::string> ids;
    mutable std::map<std::string, std::string> files;
};

execution_result make_result(const std::string &output, int exitcode = 0, const std::string &error = "");

}  // namespace quizjudge
