#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace quizjudge {

/**
 * @brief 一次评测独占的工作目录
 * 工作目录只在一次 evaluate 调用内存在，不同的评测不会共享工作目录
 */
struct workspace {
    /**
     * @brief 工作目录的唯一标识，同时也是目录名
     */
    std::string id;

    /**
     * @brief 工作目录的绝对路径
     */
    std::filesystem::path path;
};

/**
 * @brief 在 scratch 根目录下分配、写入、回收工作目录
 * 所有成员函数都可以被多个评测线程同时调用
 *
 * SCRATCH_DIR
 * ├── exec_3f2a... // 随机生成的 uuid
 * │   ├── harness.py // 评测脚本
 * │   ├── user_code.py // 选手代码（编程题）
 * │   ├── test_cases.json // 测试点（编程题）
 * │   ├── schema.sql // 建表脚本（SQL 题）
 * │   ├── user_query.sql // 选手查询（SQL 题）
 * │   └── reference_query.sql // 标准查询（SQL 题）
 * └── ...
 */
struct workspace_manager {
    /**
     * @param scratch_root scratch 根目录，不存在时自动创建
     * @param keep_workspaces 若为真，dispose 不删除工作目录，只用于调试
     */
    explicit workspace_manager(const std::filesystem::path &scratch_root, bool keep_workspaces = false);
    virtual ~workspace_manager();

    /**
     * @brief 创建一个新的工作目录
     * @throw permission_error 若 scratch 根目录不可写
     * @throw allocation_error 若因为其他原因无法创建目录
     */
    virtual workspace allocate() const;

    /**
     * @brief 检查工作目录可写，必须在启动沙箱之前调用
     * @throw permission_error 若工作目录不可写
     */
    virtual void verify_writable(const workspace &ws) const;

    /**
     * @brief 将文件写入工作目录
     * @param files 相对路径到文件内容的映射，路径中可以包含子目录
     * @throw std::invalid_argument 若路径是绝对路径或者包含 ".."
     * @throw permission_error 若写入失败
     */
    virtual void materialize(const workspace &ws, const std::map<std::string, std::string> &files) const;

    /**
     * @brief 删除工作目录及其中的所有文件
     * 删除失败只记录日志，目录不存在时什么也不做
     */
    virtual void dispose(const workspace &ws) const noexcept;

    const std::filesystem::path &root() const;

private:
    std::filesystem::path scratch_root;
    bool keep_workspaces;
};

/**
 * @brief 离开作用域时回收工作目录
 * 无论评测正常结束还是抛出异常，工作目录都恰好被回收一次
 */
struct scoped_workspace {
    explicit scoped_workspace(const workspace_manager &manager);
    scoped_workspace(const scoped_workspace &) = delete;
    scoped_workspace &operator=(const scoped_workspace &) = delete;
    ~scoped_workspace();

    const workspace &get() const;

    /**
     * @brief 提前回收工作目录，重复调用不会有任何效果
     */
    void dispose();

private:
    const workspace_manager &manager;
    workspace ws;
    bool disposed = false;
};

}  // namespace quizjudge
