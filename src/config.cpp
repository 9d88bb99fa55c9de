#include "config.hpp"

namespace quizjudge {
using namespace std;

filesystem::path SCRATCH_DIR = "/tmp";
filesystem::path SCRIPT_DIR;
string DOCKER_SOCKET = "/var/run/docker.sock";
string DOCKER_API_VERSION = "v1.41";
string SANDBOX_IMAGE = "python:3.9-slim";
string SANDBOX_MOUNT_DIR = "/app";
string PYTHON_INTERPRETER;
sandbox_limits CODE_LIMITS;
sandbox_limits QUERY_LIMITS;
bool DEBUG = false;

const sandbox_limits &limits_for(language lang) {
    switch (lang) {
        case language::QUERY:
            return QUERY_LIMITS;
        default:
            return CODE_LIMITS;
    }
}

}  // namespace quizjudge
