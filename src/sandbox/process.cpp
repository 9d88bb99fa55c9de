#include "sandbox/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <optional>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace quizjudge {
using namespace std;

static const size_t BUF_SIZE = 4096;
static const int POLL_INTERVAL_MS = 50;

/**
 * @brief 子进程通过 close-on-exec 管道向父进程报告的错误
 * exec 成功后管道被关闭，父进程读到 EOF
 */
struct child_report {
    enum stage_type : int {
        NETWORK_ISOLATION = 0,  // 只是警告，子进程继续执行
        REDIRECT,
        CHDIR,
        RLIMIT,
        EXEC
    } stage;
    int err;
};

static void report_to_parent(int fd, child_report::stage_type stage, int err) {
    child_report report{stage, err};
    ssize_t ret = write(fd, &report, sizeof(report));
    (void)ret;
}

[[noreturn]] static void child_fail(int fd, child_report::stage_type stage) {
    report_to_parent(fd, stage, errno);
    _exit(127);
}

static const char *stage_name(int stage) {
    switch (stage) {
        case child_report::NETWORK_ISOLATION:
            return "isolating network";
        case child_report::REDIRECT:
            return "redirecting standard streams";
        case child_report::CHDIR:
            return "entering workspace";
        case child_report::RLIMIT:
            return "setting resource limits";
        case child_report::EXEC:
            return "starting interpreter";
    }
    return "unknown";
}

static bool set_rlimit(int resource, rlim_t limit) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = limit;
    return setrlimit(resource, &lim) == 0;
}

process_runner::process_runner(const string &interpreter)
    : interpreter(interpreter) {}

string process_runner::type() const {
    return "process";
}

execution_result process_runner::run(const workspace &ws, const vector<string> &command, const sandbox_limits &limits) const {
    if (command.empty()) throw invalid_argument("empty sandbox command");

    // fork 之后子进程只能调用 async-signal-safe 的函数，所有内存分配都在这里完成
    vector<string> cmd = command;
    if (!interpreter.empty()) cmd[0] = interpreter;
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);
    string workdir = ws.path.string();
    rlim_t cpu_limit = (rlim_t)ceil(limits.wall_time_limit) + 1;

    int out_pipe[2], err_pipe[2], report_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw sandbox_unavailable_error(fmt::format("unable to create pipe: {}", strerror(errno)));
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]), close(out_pipe[1]);
        throw sandbox_unavailable_error(fmt::format("unable to create pipe: {}", strerror(errno)));
    }
    if (pipe2(report_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]), close(out_pipe[1]);
        close(err_pipe[0]), close(err_pipe[1]);
        throw sandbox_unavailable_error(fmt::format("unable to create pipe: {}", strerror(errno)));
    }

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], report_pipe[0], report_pipe[1]}) close(fd);
        throw sandbox_unavailable_error(fmt::format("unable to fork: {}", strerror(err)));
    }

    if (pid == 0) {  // child process, run the command
        int report_fd = report_pipe[1];
        setsid();

        if (limits.network_disabled &&
            unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0 &&
            unshare(CLONE_NEWNET) != 0)
            report_to_parent(report_fd, child_report::NETWORK_ISOLATION, errno);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail(report_fd, child_report::REDIRECT);
        if (dup2(out_pipe[1], STDOUT_FILENO) < 0) child_fail(report_fd, child_report::REDIRECT);
        if (dup2(err_pipe[1], STDERR_FILENO) < 0) child_fail(report_fd, child_report::REDIRECT);

        if (chdir(workdir.c_str()) != 0) child_fail(report_fd, child_report::CHDIR);

        if (!set_rlimit(RLIMIT_CORE, 0)) child_fail(report_fd, child_report::RLIMIT);
        if (limits.memory_limit > 0 && !set_rlimit(RLIMIT_AS, (rlim_t)limits.memory_limit))
            child_fail(report_fd, child_report::RLIMIT);
        if (!set_rlimit(RLIMIT_CPU, cpu_limit)) child_fail(report_fd, child_report::RLIMIT);
        if (limits.file_limit > 0 && !set_rlimit(RLIMIT_FSIZE, (rlim_t)limits.file_limit))
            child_fail(report_fd, child_report::RLIMIT);

        execvp(args[0], args.data());
        child_fail(report_fd, child_report::EXEC);
    }

    // watchdog
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(report_pipe[1]);

    bool exited = false;
    int status = 0;
    defer {
        if (!exited) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
        }
    };

    // 读取子进程的报告，exec 成功或者子进程退出后管道关闭
    child_report report;
    ssize_t nread;
    optional<child_report> failure;
    while ((nread = read(report_pipe[0], &report, sizeof(report))) != 0) {
        if (nread < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (nread != sizeof(report)) break;
        if (report.stage == child_report::NETWORK_ISOLATION)
            LOG(WARNING) << "Unable to isolate network of sandbox process, running with host network: " << strerror(report.err);
        else
            failure = report;
    }
    close(report_pipe[0]);

    if (failure) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        waitpid(pid, &status, 0);
        exited = true;
        throw sandbox_unavailable_error(fmt::format("Error {} for {}: {}", stage_name(failure->stage), cmd[0], strerror(failure->err)));
    }

    execution_result result;
    int fds[2] = {out_pipe[0], err_pipe[0]};
    string *buffers[2] = {&result.output, &result.error};
    defer {
        for (int fd : fds)
            if (fd != -1) close(fd);
    };

    chrono::milliseconds exit_time(0);
    char buf[BUF_SIZE];
    while (true) {
        if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
            exited = true;
            exit_time = timer.duration<chrono::milliseconds>();
            // 杀死残留在进程组中的后台进程，否则它们会一直持有管道
            kill(-pid, SIGKILL);
        }
        if (fds[0] == -1 && fds[1] == -1 && exited) break;

        if (!exited && timer.seconds() >= limits.wall_time_limit) {
            LOG(WARNING) << "Sandbox process " << pid << " exceeded wall time limit " << limits.wall_time_limit << "s, killing";
            result.timed_out = true;
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
            exited = true;
            exit_time = timer.duration<chrono::milliseconds>();
        }
        // 进程退出后管道仍未关闭且没有新的输出时，最多再等待两个时间片
        if (exited && timer.duration<chrono::milliseconds>() - exit_time > chrono::milliseconds(POLL_INTERVAL_MS * 2)) break;

        struct pollfd pfds[2];
        nfds_t nfds = 0;
        int index[2];
        for (int i = 0; i < 2; ++i) {
            if (fds[i] == -1) continue;
            pfds[nfds].fd = fds[i];
            pfds[nfds].events = POLLIN;
            pfds[nfds].revents = 0;
            index[nfds++] = i;
        }
        if (nfds == 0) {
            // 输出已经结束，等待进程退出
            usleep(POLL_INTERVAL_MS * 1000 / 5);
            continue;
        }

        int ret = poll(pfds, nfds, POLL_INTERVAL_MS);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "polling sandbox output");
        }
        for (nfds_t k = 0; k < nfds; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = index[k];
            nread = read(fds[i], buf, BUF_SIZE);
            if (nread < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw system_error(errno, system_category(), "reading sandbox output");
            }
            if (nread == 0) {
                // EOF detected: close fd and indicate this with -1
                close(fds[i]);
                fds[i] = -1;
                continue;
            }
            append_limited(*buffers[i], buf, nread, limits.output_limit, result.truncated);
            if (exited) exit_time = timer.duration<chrono::milliseconds>();
        }
    }

    result.wall_time = timer.seconds();
    if (WIFEXITED(status))
        result.exitcode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exitcode = 128 + WTERMSIG(status);
    if (result.truncated)
        LOG(INFO) << "Output of sandbox process " << pid << " truncated at " << limits.output_limit << " bytes";
    return result;
}

}  // namespace quizjudge
