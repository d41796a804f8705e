#include "sandbox/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cstring>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "runguard.hpp"

namespace execjudge {
using namespace std;

// 轮询子进程状态的间隔
static const useconds_t POLL_INTERVAL = 10000;  // 10ms

// SIGTERM 之后等待 runguard 自行清理的时间
static const auto KILL_GRACE = chrono::seconds(2);

static void close_inherited_fds() {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, 3, ~0U, 0) == 0) return;
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = 3; fd < max_fd; ++fd) close(fd);
}

static bool try_reap(pid_t pid, int &status) {
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return true;
        if (ret == 0) return false;
        if (errno == EINTR) continue;
        throw system_error(errno, system_category(), "waitpid");
    }
}

void kill_leftovers(const runguard_result &result) {
    // 进程组已经不存在时 kill 返回 ESRCH
    if (result.child_pid > 0 && kill(-result.child_pid, SIGKILL) == 0)
        LOG(WARNING) << "Killed leftover process group " << result.child_pid;

    // 调用了 setsid 的后代进程不在进程组中，但仍然在 runguard 的 cgroup 中
    for (auto &path : result.cgroup_paths) {
        filesystem::path dir = path;
        if (!filesystem::is_directory(dir)) continue;
        if (filesystem::exists(dir / "cgroup.kill")) {
            ofstream fout(dir / "cgroup.kill");
            fout << "1";
        }
        for (int round = 0; round < 10; ++round) {
            vector<pid_t> pids;
            ifstream fin(dir / "cgroup.procs");
            pid_t pid;
            while (fin >> pid) pids.push_back(pid);
            if (pids.empty()) break;
            for (pid_t leftover : pids) kill(leftover, SIGKILL);
            usleep(POLL_INTERVAL);
        }
        if (rmdir(dir.c_str()) == 0)
            LOG(WARNING) << "Removed leftover cgroup " << dir;
        else
            LOG(ERROR) << "Unable to remove leftover cgroup " << dir << ": " << strerror(errno);
    }
}

process_result exec_program(const vector<string> &argv,
                            const filesystem::path &log_file,
                            const filesystem::path &metafile,
                            double timeout,
                            const cancellation_token *cancel) {
    LOG(INFO) << boost::algorithm::join(argv, " ");

    // fork 之后的子进程只能调用 async-signal-safe 的函数，参数和文件都要提前准备好
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    int log_fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (log_fd < 0) throw system_error(errno, system_category(), "unable to open " + log_file.string());
    defer { close(log_fd); };

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) throw system_error(errno, system_category(), "unable to open /dev/null");
    defer { close(null_fd); };

    pid_t pid = fork();
    switch (pid) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0: {  // 子进程
            sigset_t empty;
            sigemptyset(&empty);
            sigprocmask(SIG_SETMASK, &empty, nullptr);
            if (dup2(null_fd, STDIN_FILENO) < 0 ||
                dup2(log_fd, STDOUT_FILENO) < 0 ||
                dup2(log_fd, STDERR_FILENO) < 0)
                _exit(127);
            close_inherited_fds();
            execv(args[0], args.data());
            _exit(127);
        }
        default:
            break;
    }

    process_result result;
    elapsed_time timer;
    int status = 0;
    bool reaped = false;
    while (!(reaped = try_reap(pid, status))) {
        bool expired = timer.duration<chrono::duration<double>>().count() > timeout;
        if (expired || (cancel && cancel->cancelled())) {
            result.killed = true;
            break;
        }
        usleep(POLL_INTERVAL);
    }

    if (!reaped) {
        // runguard 收到 SIGTERM 后会杀死它的进程组并写入 meta 文件
        kill(pid, SIGTERM);
        elapsed_time grace;
        while (!(reaped = try_reap(pid, status)) && grace.duration<chrono::seconds>() < KILL_GRACE)
            usleep(POLL_INTERVAL);
        if (!reaped) {
            LOG(ERROR) << "runguard " << pid << " did not exit after SIGTERM, sending SIGKILL";
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
    }

    // runguard 正常结束时已经清理了进程组和 cgroup
    if (result.killed || !WIFEXITED(status))
        kill_leftovers(read_runguard_result(metafile));

    if (WIFEXITED(status))
        result.exitcode = WEXITSTATUS(status);
    else
        result.exitcode = -1;
    return result;
}

}  // namespace execjudge
