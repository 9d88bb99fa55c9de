#include "judge/judger.hpp"
#include <glog/logging.h>

namespace quizjudge {
using namespace std;

judger::~judger() {}

sandboxed_judger::sandboxed_judger(const workspace_manager &workspaces, const sandbox_runner &runner, const harness_generator &generator)
    : workspaces(workspaces), runner(runner), generator(generator) {}

execution_result sandboxed_judger::execute(const submission &submit, const harness &h, const sandbox_limits &limits) const {
    scoped_workspace ws(workspaces);
    workspaces.verify_writable(ws.get());
    workspaces.materialize(ws.get(), h.files);

    LOG(INFO) << "Running " << submit << " in " << runner.type() << " sandbox, workspace " << ws.get().id;
    execution_result result = runner.run(ws.get(), h.command, limits);
    LOG(INFO) << submit << " finished in " << result.wall_time << "s with exit code " << result.exitcode
              << (result.timed_out ? " (timed out)" : "");
    return result;
}

}  // namespace quizjudge
