#include "common/io_utils.hpp"
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace quizjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    ostringstream content;
    content << fin.rdbuf();
    return content.str();
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + path.string());
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

size_t utf8_sequence_length(const string &text, size_t pos) {
    auto byte = [&](size_t i) { return (unsigned char)text[i]; };
    unsigned char lead = byte(pos);
    size_t length;
    unsigned char lower = 0x80, upper = 0xBF;  // 第二个字节的取值范围
    if (lead < 0x80) return 1;
    else if (lead >= 0xC2 && lead <= 0xDF) length = 2;
    else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lower = 0xA0;       // 超长编码
        else if (lead == 0xED) upper = 0x9F;  // U+D800 到 U+DFFF
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lower = 0x90;
        else if (lead == 0xF4) upper = 0x8F;  // 超过 U+10FFFF
    } else
        return 0;

    if (pos + length > text.size()) return 0;
    if (byte(pos + 1) < lower || byte(pos + 1) > upper) return 0;
    for (size_t i = 2; i < length; ++i)
        if ((byte(pos + i) & 0xC0) != 0x80) return 0;
    return length;
}

bool utf8_check_is_valid(const string &text) {
    for (size_t pos = 0; pos < text.size();) {
        size_t length = utf8_sequence_length(text, pos);
        if (!length) return false;
        pos += length;
    }
    return true;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

bool is_writable_directory(const fs::path &dir) {
    error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
    return access(dir.c_str(), W_OK | X_OK) == 0;
}

}  // namespace quizjudge
