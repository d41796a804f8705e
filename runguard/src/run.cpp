#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include "cgroup.hpp"
#include "limits.hpp"
#include "runguard_options.hpp"
#include "utils.hpp"

using namespace std;
namespace fs = std::filesystem;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

// 子进程结束后最多再花多少时间读取管道中剩余的输出
const double DRAIN_TIMEOUT = 1.0;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const int TIMELIMIT_SOFT = 1;
const int TIMELIMIT_HARD = 2;

// 子进程启动失败时的退出码，与 shell 的 "command not found" 一致
const int EXIT_LAUNCH_FAILURE = 127;

// 子进程通过 error pipe 报告的记录类型，每条记录以换行结束
const char FAILURE_INTERNAL = 'I';
const char FAILURE_LAUNCH = 'L';
const char WARNING_PARTIAL_ISOLATION = 'W';

int walllimit = 0, cpulimit = 0;

ofstream metafile;
int child_pid = -1;
string cgroupname;
string rootfs;
static volatile sig_atomic_t received_SIGCHLD = 0;
static volatile sig_atomic_t received_signal = -1;

template <typename... Args>
void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

template <typename T>
void append_meta(const char *key, T message) {
    if (!metafile) return;
    metafile << key << ": " << message << endl;
}

void runguard_terminate_handler() {
    sigset_t sigs;
    /*
	 * Make sure the signal handler for these (terminate()) does not
	 * interfere, we are exiting now anyway.
	 */
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    exception_ptr cur = current_exception();
    try {
        if (cur) {
            rethrow_exception(cur);
        }
    } catch (const exception &e) {
        LOG(ERROR) << e.what();
        append_meta("internal-error", e.what());
    } catch (...) {
        LOG(ERROR) << "Unknown exception occurred";
        append_meta("internal-error", "unknown exception");
    }

    /* Make sure that all children are killed before terminating */
    if (child_pid > 0) {
        LOG(INFO) << "sending SIGKILL";
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG(ERROR) << "unable to send SIGKILL to children while terminating due to previous error: "
                       << strerror(errno);
        }

        /* Wait a while to make sure the process is killed by now. */
        nanosleep(&killdelay, nullptr);
    }

    if (!cgroupname.empty()) {
        runguard_options opt;
        opt.cgroupname = cgroupname;
        try {
            cgroup_kill(opt);
            cgroup_delete(opt);
        } catch (cgroup_exception &ex) {
            LOG(ERROR) << "unable to clean up cgroup " << cgroupname << ": " << ex.what();
        }
    }
    kill_orphans();
    if (!rootfs.empty()) rmdir(rootfs.c_str());

    exit(EXIT_FAILURE);
}

/**
 * @brief 读取 cgroupfs 中 "key value" 格式文件里 key 对应的值
 * 比如 memory.events 中的 oom_kill，cpu.stat 中的 usage_usec
 * @return 文件或键不存在时返回 -1
 */
static int64_t read_cgroup_stat(const string &path, const string &key) {
    ifstream fin(path);
    string token;
    while (fin >> token) {
        int64_t value;
        if (token == key && fin >> value) return value;
    }
    return -1;
}

/**
 * @brief 读取 cgroupfs 中只有一个整数的文件，比如 memory.peak
 * @return 文件不存在时返回 -1
 */
static int64_t read_cgroup_value(const string &path) {
    ifstream fin(path);
    int64_t value;
    if (fin >> value) return value;
    return -1;
}

static double timespec_diff(const struct timespec &start, const struct timespec &end) {
    return (end.tv_sec - start.tv_sec) + (end.tv_nsec - start.tv_nsec) * 1E-9;
}

static void summarize(const runguard_options &opt, int exitcode,
                      struct timespec starttime, struct timespec endtime,
                      const struct rusage &usage,
                      size_t data_passed[3], size_t data_read[3]) {
    static const char output_timelimit_str[4][16] = {
        "",
        "soft-timelimit",
        "hard-timelimit",
        "hard-timelimit"};

    double userdiff = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1E-6;
    double sysdiff = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1E-6;
    double cpudiff = userdiff + sysdiff;
    int64_t max_usage = -1;
    string memory_source = "rusage";
    bool is_oom = false;

    if (!opt.cgroupname.empty()) {
        string memory_dir = cgroup_guard::fs_path("memory", opt.cgroupname);
        if (cgroup_guard::unified()) {
            max_usage = read_cgroup_value(memory_dir + "/memory.peak");
            is_oom = read_cgroup_stat(memory_dir + "/memory.events", "oom_kill") > 0;
            int64_t usage_usec = read_cgroup_stat(memory_dir + "/cpu.stat", "usage_usec");
            if (usage_usec >= 0) cpudiff = (double)usage_usec / 1e6;
        } else {
            max_usage = read_cgroup_value(memory_dir + "/memory.memsw.max_usage_in_bytes");
            if (max_usage < 0) max_usage = read_cgroup_value(memory_dir + "/memory.max_usage_in_bytes");
            is_oom = read_cgroup_stat(memory_dir + "/memory.oom_control", "oom_kill") > 0;
            int64_t cpu_time = read_cgroup_value(cgroup_guard::fs_path("cpuacct", opt.cgroupname) + "/cpuacct.usage");  // in ns
            if (cpu_time >= 0) cpudiff = (double)cpu_time / 1e9;
        }
        if (max_usage >= 0) memory_source = "cgroup";

        // 杀死 cgroup 内所有的进程，以确保父进程结束后不会有进程残留，
        // so our timing is correct: no child processes can survive longer than
        // our monitored process.
        cgroup_kill(opt);
        try {
            cgroup_delete(opt);
        } catch (cgroup_exception &ex) {
            LOG(ERROR) << "unable to delete cgroup " << opt.cgroupname << ": " << ex.what();
        }
    }

    if (max_usage < 0 && usage.ru_maxrss > 0)
        max_usage = (int64_t)usage.ru_maxrss * 1024;  // ru_maxrss is in kilobytes

    if (max_usage >= 0) {
        LOG(INFO) << "total memory used: " << max_usage / 1024 << "kB";
        append_meta("memory-bytes", max_usage);
        append_meta("memory-source", memory_source);
    }
    append_meta("memory-result", is_oom ? "oom" : "");

    append_meta("exitcode", exitcode);

    if (received_signal != -1) {
        append_meta("signal", (int)received_signal);
    }

    double walldiff = timespec_diff(starttime, endtime);

    append_meta("wall-time", fmt::format("{:.3f}", walldiff));
    append_meta("user-time", fmt::format("{:.3f}", userdiff));
    append_meta("sys-time", fmt::format("{:.3f}", sysdiff));
    append_meta("cpu-time", fmt::format("{:.3f}", cpudiff));

    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}", walldiff, userdiff, sysdiff);

    if (opt.use_wall_limit && walldiff > opt.wall_limit.soft) {
        walllimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }

    if (opt.use_cpu_limit && cpudiff > opt.cpu_limit.soft) {
        cpulimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }

    append_meta("time-result", output_timelimit_str[walllimit | cpulimit]);

    if (opt.stream_size >= 0) {
        using namespace boost::assign;
        vector<string> output_truncated;
        if (data_passed[STDOUT_FILENO] < data_read[STDOUT_FILENO])
            output_truncated += "stdout";
        if (data_passed[STDERR_FILENO] < data_read[STDERR_FILENO])
            output_truncated += "stderr";
        append_meta("output-truncated", boost::algorithm::join(output_truncated, ","));
    }

    append_meta("stdout-bytes", data_read[STDOUT_FILENO]);
    append_meta("stderr-bytes", data_read[STDERR_FILENO]);
}

void terminate(int sig) {
    struct sigaction sigact;

    /* The command is being killed, later SIGTERM or SIGALRM must not kill
       runguard before it writes the meta file. */
    sigact.sa_handler = SIG_IGN;
    sigact.sa_flags = 0;
    if (sigemptyset(&sigact.sa_mask) != 0)
        LOG(WARNING) << "could not initialize signal mask";
    if (sigaction(SIGTERM, &sigact, NULL) != 0)
        LOG(WARNING) << "could not restore signal handler";
    if (sigaction(SIGALRM, &sigact, NULL) != 0)
        LOG(WARNING) << "could not restore signal handler";

    if (sig == SIGALRM) {
        walllimit |= TIMELIMIT_HARD;
        LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
    } else {
        LOG(WARNING) << "received signal " << sig << ": aborting command";
    }

    received_signal = sig;

    /* First try to kill graciously, then hard.
	   Don't report an already exited process as error. */
    LOG(INFO) << "sending SIGTERM";
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH) {
        error(errno, "sending SIGTERM to command");
    }

    /* Prefer nanosleep over sleep because of higher resolution and
	   it does not interfere with signals. */
    nanosleep(&killdelay, NULL);

    LOG(INFO) << "sending SIGKILL";
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) {
        error(errno, "sending SIGKILL to command");
    }

    /* Wait another while to make sure the process is killed by now. */
    nanosleep(&killdelay, NULL);
}

/**
 * @brief 杀死被 runguard 收养的后代进程
 * runguard 是 child subreaper，选手程序的后代进程在父进程结束后由 runguard 收养，
 * 即使它们调用 setsid 离开了进程组。没有 PID 命名空间和 cgroup 时依靠这里清理。
 */
static void kill_orphans() {
    pid_t self = getpid();
    for (int round = 0; round < 10; ++round) {
        bool found = false;
        error_code ec;
        for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
            string name = it->path().filename().string();
            if (name.find_first_not_of("0123456789") != string::npos) continue;

            ifstream fin(it->path() / "stat");
            string stat;
            getline(fin, stat);
            // 格式为 "pid (comm) state ppid ..."，comm 中可能含有空格和括号
            size_t end_of_comm = stat.rfind(')');
            if (end_of_comm == string::npos) continue;
            char state;
            int ppid;
            if (sscanf(stat.c_str() + end_of_comm + 1, " %c %d", &state, &ppid) != 2) continue;
            if (ppid != self) continue;

            found = true;
            int pid = stoi(name);
            LOG(WARNING) << "killing leftover process " << pid;
            kill(pid, SIGKILL);
        }
        while (waitpid(-1, nullptr, WNOHANG) > 0) {}
        if (!found) return;
        nanosleep(&killdelay, NULL);
    }
    LOG(ERROR) << "orphaned descendants are still alive";
}

static void child_handler(int /* signal */) {
    received_SIGCHLD = true;
}

static void pump_pipes(struct runguard_options &opt, fd_set *readfds, int child_pipefd[3][2], int child_redirfd[3], size_t data_read[], size_t data_passed[]) {
    char buf[BUF_SIZE];
    ssize_t nread, nwritten;
    size_t to_read, to_write;
    int i;

    /* Check to see if data is available and pass it on */
    for (i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] != -1 &&
            FD_ISSET(child_pipefd[i][PIPE_OUT], readfds)) {
            if (opt.stream_size >= 0 && data_passed[i] == (size_t)opt.stream_size) {
                /* Throw away data if we're at the output limit, but
				   still count how much data we consumed  */
                nread = read(child_pipefd[i][PIPE_OUT], buf, BUF_SIZE);
            } else {
                /* Otherwise copy the output to a file */
                to_read = BUF_SIZE;
                if (opt.stream_size >= 0) {
                    to_read = min((size_t)BUF_SIZE, (size_t)opt.stream_size - data_passed[i]);
                }

                nread = read(child_pipefd[i][PIPE_OUT], buf, to_read);
                if (nread > 0) {
                    to_write = nread;
                    char *p = buf;
                    while (to_write > 0) {
                        nwritten = write(child_redirfd[i], p, to_write);
                        if (nwritten == -1) {
                            if (errno == EINTR) continue;
                            nread = -1;
                            break;
                        }
                        to_write -= nwritten;
                        p += nwritten;
                    }
                }

                if (nread > 0) data_passed[i] += nread;

                /* print message if we're at the streamsize limit */
                if (opt.stream_size >= 0 && data_passed[i] == (size_t)opt.stream_size) {
                    LOG(INFO) << "child fd " << i << " limit reached";
                }
            }
            if (nread == -1) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                error(errno, "copying data fd {}", i);
            }
            if (nread == 0) {
                /* EOF detected: close fd and indicate this with -1 */
                if (close(child_pipefd[i][PIPE_OUT]) != 0) {
                    error(errno, "closing pipe for fd {}", i);
                }
                child_pipefd[i][PIPE_OUT] = -1;
                continue;
            }
            data_read[i] += nread;
        }
    }
}

/**
 * @brief 子进程只能通过 error pipe 向 runguard 报告，不能写 meta 文件
 */
static void child_report(int errfd, char kind, string message) {
    replace(message.begin(), message.end(), '\n', ' ');
    string report = kind + message + '\n';
    ssize_t ignored = write(errfd, report.data(), report.size());
    (void)ignored;
}

[[noreturn]] static void child_fail(int errfd, char kind, const string &message) {
    child_report(errfd, kind, message);
    _exit(EXIT_LAUNCH_FAILURE);
}

[[noreturn]] static void run_child(struct runguard_options &opt, int child_pipefd[3][2], int errfd) {
    try {
        if (!opt.stdin_filename.empty()) {
            int fd = open(opt.stdin_filename.c_str(), O_RDONLY);
            if (fd < 0) error(errno, "opening stdin file");
            if (dup2(fd, STDIN_FILENO) < 0) error(errno, "redirecting stdin");
            close(fd);
        }

        if (!set_restrictions(opt))
            child_report(errfd, WARNING_PARTIAL_ISOLATION, "unable to restrict filesystem");

        // 将管道连接到 stdout/stderr。
        for (int i = 1; i <= 2; ++i) {
            if (dup2(child_pipefd[i][PIPE_IN], i) < 0) {
                error(errno, "redirecting child fd {}", i);
            }
            if (close(child_pipefd[i][PIPE_IN]) != 0 ||
                close(child_pipefd[i][PIPE_OUT]) != 0) {
                error(errno, "closing pipe for fd {}", i);
            }
        }

        if (!set_seccomp(opt) && opt.require_isolation)
            child_fail(errfd, FAILURE_INTERNAL, "unable to load seccomp filter");
    } catch (const exception &e) {
        child_fail(errfd, FAILURE_INTERNAL, e.what());
    }

    auto &cmd = opt.command;
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    execvp(args[0], args.data());
    child_fail(errfd, FAILURE_LAUNCH, fmt::format("unable to start command {}: {}", cmd[0], strerror(errno)));
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);
    metafile.open(opt.metafile_path.c_str(), ofstream::out);

    int child_pipefd[3][2];
    int child_redirfd[3];
    int errpipe[2];

    /* Setup pipes connecting to child stdout/err streams (ignore stdin). */
    for (int i = 1; i <= 2; i++) {
        if (pipe(child_pipefd[i]) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(errpipe, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    {
        struct sigaction sigact;
        sigset_t sigmask, emptymask;
        if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");

        /* unmask all signals, except SIGCHLD: detected in pselect() below */
        sigmask = emptymask;
        if (sigaddset(&sigmask, SIGCHLD) != 0) error(errno, "setting signal mask");
        if (sigprocmask(SIG_SETMASK, &sigmask, NULL) != 0) {
            error(errno, "unmasking signals");
        }

        /* Construct signal handler for SIGCHLD detection in pselect(). */
        received_SIGCHLD = 0;
        sigact.sa_handler = child_handler;
        sigact.sa_flags = 0;
        sigact.sa_mask = emptymask;
        if (sigaction(SIGCHLD, &sigact, NULL) != 0) {
            error(errno, "installing signal handler");
        }
    }

    opt.cgroupname = fmt::format("/execjudge/box_{}_{}", getpid(), (int)time(NULL));
    if (!cgroup_create(opt)) opt.cgroupname.clear();
    cgroupname = opt.cgroupname;
    if (!opt.cgroupname.empty()) {
        // runguard 自身被强制杀死时，调用者根据这些目录清理 cgroup
        string paths = cgroup_guard::fs_path("memory", opt.cgroupname);
        if (!cgroup_guard::unified()) paths += "," + cgroup_guard::fs_path("cpuacct", opt.cgroupname);
        append_meta("cgroup-paths", paths);
    }

    if (!opt.work_dir.empty() && opt.user_id >= 0) {
        // 选手程序需要在工作目录中写入编译产物和临时文件
        string work_dir = opt.chroot_dir + opt.work_dir;
        if (chown(work_dir.c_str(), opt.user_id, opt.group_id) != 0)
            error(errno, "changing owner of {}", work_dir);
    }

    bool isolated = isolate_namespaces();
    if (!isolated && opt.require_isolation)
        throw runtime_error("namespace isolation is unavailable");
    append_meta("isolation", isolated ? "full" : "partial");

    if (isolated && opt.chroot_dir.empty()) {
        // 最小根目录建在工作目录旁边，随调用者的临时目录一起删除
        if (!opt.work_dir.empty()) opt.work_dir = fs::canonical(opt.work_dir).string();
        string parent = opt.work_dir.empty() ? "/tmp" : fs::path(opt.work_dir).parent_path().string();
        string pattern = parent + "/root-XXXXXX";
        if (!mkdtemp(pattern.data())) error(errno, "creating root directory in {}", parent);
        opt.rootfs = rootfs = pattern;
    }

    // 选手程序的后代进程成为孤儿后由 runguard 收养，而不是 init
    if (prctl(PR_SET_CHILD_SUBREAPER, 1) != 0) error(errno, "becoming child subreaper");

    switch (child_pid = fork()) {
        case -1:
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // child process, run the command
            close(errpipe[PIPE_OUT]);
            run_child(opt, child_pipefd, errpipe[PIPE_IN]);
        default: {  // watchdog
            close(errpipe[PIPE_IN]);
            append_meta("child-pid", child_pid);

            if (opt.user_id < 0) {
                /*
                 * Shed privileges, only if not using a separate child uid,
                 * because in that case we may need root privileges to kill
                 * the child process.
                 */
                if (setuid(getuid()) != 0) throw system_error(errno, system_category(), "setting watchdog uid");
            }

            int status = 0, exitcode;
            struct rusage usage;
            struct timespec starttime, endtime;
            size_t data_read[3];
            size_t data_passed[3];
            fd_set readfds;

            if (clock_gettime(CLOCK_MONOTONIC, &starttime) != 0)
                error(errno, "getting time");

            {
                /* Close unused file descriptors */
                for (int i = 1; i <= 2; i++) {
                    if (close(child_pipefd[i][PIPE_IN]) != 0) {
                        error(errno, "closing pipe for fd {}", i);
                    }
                }

                /* Redirect child stdout/stderr to file */
                for (int i = 1; i <= 2; i++) {
                    child_redirfd[i] = i;              /* Default: no redirects */
                    data_read[i] = data_passed[i] = 0; /* Reset data counters */
                }
                data_read[0] = 0;
                if (!opt.stdout_filename.empty()) {
                    child_redirfd[STDOUT_FILENO] = creat(opt.stdout_filename.c_str(), S_IRUSR | S_IWUSR);
                    if (child_redirfd[STDOUT_FILENO] < 0) {
                        error(errno, "opening file '{}'", opt.stdout_filename);
                    }
                }
                if (!opt.stderr_filename.empty()) {
                    if (opt.stderr_filename == opt.stdout_filename) {
                        child_redirfd[STDERR_FILENO] = child_redirfd[STDOUT_FILENO];
                    } else {
                        child_redirfd[STDERR_FILENO] = creat(opt.stderr_filename.c_str(), S_IRUSR | S_IWUSR);
                        if (child_redirfd[STDERR_FILENO] < 0) {
                            error(errno, "opening file '{}'", opt.stderr_filename);
                        }
                    }
                }
            }

            sigset_t emptymask;
            if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");

            {
                sigset_t sigmask;
                struct sigaction sigact;

                /* Construct one-time signal handler to terminate() for TERM
		           and ALRM signals. */
                sigmask = emptymask;
                if (sigaddset(&sigmask, SIGALRM) != 0 || sigaddset(&sigmask, SIGTERM) != 0)
                    error(errno, "setting signal mask");

                sigact.sa_handler = terminate;
                sigact.sa_flags = SA_RESTART;
                sigact.sa_mask = sigmask;

                /* Kill child command when we receive SIGTERM */
                if (sigaction(SIGTERM, &sigact, NULL) != 0) {
                    error(errno, "installing signal handler");
                }

                if (opt.use_wall_limit) {
                    /* Kill child when we receive SIGALRM */
                    if (sigaction(SIGALRM, &sigact, NULL) != 0) {
                        error(errno, "installing signal handler");
                    }

                    double tmpd;
                    struct itimerval itimer;
                    /* Trigger SIGALRM via setitimer:  */
                    itimer.it_interval.tv_sec = 0;
                    itimer.it_interval.tv_usec = 0;
                    itimer.it_value.tv_sec = (int)opt.wall_limit.hard;
                    itimer.it_value.tv_usec = (int)(modf(opt.wall_limit.hard, &tmpd) * 1E6);

                    if (setitimer(ITIMER_REAL, &itimer, NULL) != 0) {
                        error(errno, "setting timer");
                    }
                    LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
                }
            }

            while (1) {
                FD_ZERO(&readfds);
                int nfds = -1;
                for (int i = 1; i <= 2; i++) {
                    if (child_pipefd[i][PIPE_OUT] >= 0) {
                        FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
                        nfds = max(nfds, child_pipefd[i][PIPE_OUT]);
                    }
                }

                int r = pselect(nfds + 1, &readfds, NULL, NULL, NULL, &emptymask);
                if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

                if (received_SIGCHLD || received_signal == SIGALRM) {
                    // 被收养的孤儿进程结束时也会收到 SIGCHLD，它们在 kill_orphans 中回收
                    received_SIGCHLD = 0;
                    int pid;
                    if ((pid = wait4(child_pid, &status, WNOHANG, &usage)) < 0) error(errno, "waiting on child");
                    if (pid == child_pid) break;
                }

                if (r > 0) pump_pipes(opt, &readfds, child_pipefd, child_redirfd, data_read, data_passed);
            }

            /* Stop the wall clock timer, the command has exited */
            struct itimerval itimer = {};
            setitimer(ITIMER_REAL, &itimer, NULL);

            if (clock_gettime(CLOCK_MONOTONIC, &endtime) != 0)
                error(errno, "getting time");

            /* Descendants of the command may still hold the pipes open, even
               ones that left the process group with setsid(). */
            if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to kill process group " << child_pid << ": " << strerror(errno);
            if (!opt.cgroupname.empty()) cgroup_kill(opt);
            kill_orphans();

            /* Drain the remaining output. A writer that escaped both kills
               must not block us, so stop after DRAIN_TIMEOUT or when no data
               arrives within killdelay. */
            for (int i = 1; i <= 2; i++) {
                if (child_pipefd[i][PIPE_OUT] >= 0 && fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, O_NONBLOCK) != 0)
                    error(errno, "setting pipe for fd {} non-blocking", i);
            }
            struct timespec drainstart, now;
            if (clock_gettime(CLOCK_MONOTONIC, &drainstart) != 0) error(errno, "getting time");
            while (true) {
                FD_ZERO(&readfds);
                int nfds = -1;
                for (int i = 1; i <= 2; i++) {
                    if (child_pipefd[i][PIPE_OUT] >= 0) {
                        FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
                        nfds = max(nfds, child_pipefd[i][PIPE_OUT]);
                    }
                }
                if (nfds < 0) break;

                struct timeval timeout = {0, killdelay.tv_nsec / 1000};
                int r = select(nfds + 1, &readfds, NULL, NULL, &timeout);
                if (r == -1 && errno != EINTR) error(errno, "waiting for remaining child data");
                if (r == 0) {
                    LOG(WARNING) << "output pipes are still held open after the command exited";
                    break;
                }
                if (r > 0) pump_pipes(opt, &readfds, child_pipefd, child_redirfd, data_read, data_passed);

                if (clock_gettime(CLOCK_MONOTONIC, &now) != 0) error(errno, "getting time");
                if (timespec_diff(drainstart, now) > DRAIN_TIMEOUT) {
                    LOG(WARNING) << "giving up draining output after " << DRAIN_TIMEOUT << " seconds";
                    break;
                }
            }
            for (int i = 1; i <= 2; i++) {
                if (child_pipefd[i][PIPE_OUT] >= 0) close(child_pipefd[i][PIPE_OUT]);
            }

            if (!rootfs.empty() && rmdir(rootfs.c_str()) != 0)
                LOG(WARNING) << "unable to remove " << rootfs << ": " << strerror(errno);

            /* Close the output files */
            for (int i = 1; i <= 2; i++) {
                if (child_redirfd[i] != i && (i == STDOUT_FILENO || child_redirfd[i] != child_redirfd[STDOUT_FILENO])) {
                    if (close(child_redirfd[i]) != 0) error(errno, "closing output fd {}", i);
                }
            }

            if (WIFEXITED(status)) {
                exitcode = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                // In linux, exitcode is no larger than 127.
                int sig = WTERMSIG(status);
                if (received_signal == -1) received_signal = sig;
                exitcode = sig + 128;
                switch (sig) {
                    case SIGXCPU:
                        cpulimit |= TIMELIMIT_HARD;
                        LOG(WARNING) << "Time Limit Exceeded (hard limit)";
                        break;
                    default:
                        LOG(WARNING) << "Command terminated with signal (" << sig << ", " << strsignal(sig) << ")";
                        break;
                }
            } else {
                throw runtime_error(fmt::format("unknown status: {:x}", status));
            }

            {
                string reports;
                char buf[BUF_SIZE];
                ssize_t nread;
                while ((nread = read(errpipe[PIPE_OUT], buf, sizeof(buf))) > 0)
                    reports.append(buf, nread);
                close(errpipe[PIPE_OUT]);

                size_t start = 0, end;
                while ((end = reports.find('\n', start)) != string::npos) {
                    char kind = reports[start];
                    string message = reports.substr(start + 1, end - start - 1);
                    start = end + 1;
                    if (kind == WARNING_PARTIAL_ISOLATION) {
                        LOG(WARNING) << message;
                        // 后写入的值覆盖前面的 "isolation: full"
                        append_meta("isolation", "partial");
                    } else {
                        LOG(ERROR) << "command failed to start: " << message;
                        append_meta(kind == FAILURE_LAUNCH ? "launch-error" : "internal-error", message);
                    }
                }
            }

            summarize(opt, exitcode, starttime, endtime, usage, data_passed, data_read);

            return exitcode;
        }
    }
}
