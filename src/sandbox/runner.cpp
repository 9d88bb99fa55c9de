#include "sandbox/runner.hpp"
#include <algorithm>

namespace quizjudge {
using namespace std;

sandbox_runner::~sandbox_runner() {}

void append_limited(string &buffer, const char *data, size_t size, size_t limit, bool &truncated) {
    size_t room = buffer.size() < limit ? limit - buffer.size() : 0;
    size_t count = min(room, size);
    buffer.append(data, count);
    if (count < size) truncated = true;
}

}  // namespace quizjudge
