#include "test/environment.hpp"
#include <cstdlib>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace quizjudge {
using namespace std;
namespace fs = std::filesystem;

void setup_test_environment() {
    SCRIPT_DIR = fs::path(QUIZJUDGE_SCRIPT_DIR) / "harness";
    SCRATCH_DIR = fs::temp_directory_path() / "quizjudge-test";
    fs::create_directories(SCRATCH_DIR);
}

bool python_available() {
    static bool available = system("python3 -c 'import sqlite3' > /dev/null 2>&1") == 0;
    return available;
}

fs::path make_scratch_dir(const string &name) {
    fs::path dir = SCRATCH_DIR / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

size_t count_entries(const fs::path &dir) {
    size_t count = 0;
    for ([[maybe_unused]] auto &entry : fs::directory_iterator(dir)) ++count;
    return count;
}

void readonly_workspace_manager::verify_writable(const workspace &ws) const {
    throw permission_error("No write permission for " + ws.path.string());
}

scripted_runner::scripted_runner(execution_result result)
    : result(move(result)) {}

string scripted_runner::type() const {
    return "scripted";
}

execution_result scripted_runner::run(const workspace &ws, const vector<string> &, const sandbox_limits &) const {
    map<string, string> current;
    for (auto &entry : fs::directory_iterator(ws.path))
        current[entry.path().filename().string()] = read_file_content(entry.path());
    lock_guard<mutex> guard(mut);
    ids.insert(ws.id);
    files = move(current);
    return result;
}

set<string> scripted_runner::workspace_ids() const {
    lock_guard<mutex> guard(mut);
    return ids;
}

map<string, string> scripted_runner::last_files() const {
    lock_guard<mutex> guard(mut);
    return files;
}

execution_result make_result(const string &output, int exitcode, const string &error) {
    execution_result result;
    result.output = output;
    result.error = error;
    result.exitcode = exitcode;
    result.wall_time = 0.1;
    return result;
}

}  // namespace quizjudge
