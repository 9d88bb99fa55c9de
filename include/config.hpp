#pragma once

#include <filesystem>
#include <string>
#include "judge/submission.hpp"
#include "sandbox/runner.hpp"

namespace quizjudge {

/**
 * @brief 存放工作目录的 scratch 根目录
 * 每次评测在其中创建一个唯一命名的子目录，评测结束后删除，
 * 若将这个文件夹放进内存盘，可以加速评测脚本的 IO。
 * @defaultValue /tmp
 */
extern std::filesystem::path SCRATCH_DIR;

/**
 * @brief 存放评测脚本模板的路径
 * 必须和源代码仓库根目录下的 script/harness 文件夹一致
 */
extern std::filesystem::path SCRIPT_DIR;

/**
 * @brief 容器引擎监听的 UNIX 套接字
 * @defaultValue /var/run/docker.sock
 */
extern std::string DOCKER_SOCKET;

/**
 * @brief 容器引擎的 API 版本
 */
extern std::string DOCKER_API_VERSION;

/**
 * @brief 运行评测脚本的镜像，必须包含 python3
 */
extern std::string SANDBOX_IMAGE;

/**
 * @brief 工作目录在容器内的挂载点
 */
extern std::string SANDBOX_MOUNT_DIR;

/**
 * @brief 进程后端使用的 Python 解释器，为空时从 PATH 中查找 python3
 */
extern std::string PYTHON_INTERPRETER;

/**
 * @brief 编程题的资源限制
 */
extern sandbox_limits CODE_LIMITS;

/**
 * @brief SQL 题的资源限制
 */
extern sandbox_limits QUERY_LIMITS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测结束后不删除工作目录，以便手动检查评测脚本和输出
 */
extern bool DEBUG;

const sandbox_limits &limits_for(language lang);

}  // namespace quizjudge
