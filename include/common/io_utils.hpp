#pragma once

#include <filesystem>
#include <string>

namespace quizjudge {

/**
 * @brief 读取文件的全部内容
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将文本完整写入文件，文件存在时覆盖
 * @note 写入失败时抛出 std::system_error
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 计算从 pos 开始的一个 UTF-8 字符占用的字节数
 * @return 1 到 4，若 pos 处不是合法的 UTF-8 编码（包括代理区和超长编码）则返回 0
 */
size_t utf8_sequence_length(const std::string &text, size_t pos);

bool utf8_check_is_valid(const std::string &text);

/**
 * @brief 断言 subpath 是工作目录内的相对路径
 * 工作目录中的文件名来自评测脚本和题目，如果文件名包含 "../"
 * 或者是绝对路径，写文件时就可能逃出工作目录。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 检查当前进程能否在目录中创建文件
 */
bool is_writable_directory(const std::filesystem::path &dir);

}  // namespace quizjudge
