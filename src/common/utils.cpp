#include "common/utils.hpp"
#include <cstdlib>

namespace quizjudge {
using namespace std;

string get_env(const string &key, const string &def_value) {
    const char *value = getenv(key.c_str());
    return value ? string(value) : def_value;
}

elapsed_time::elapsed_time() : start(chrono::steady_clock::now()) {}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace quizjudge
