#include "limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <math.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/mount.h>
#include <sys/socket.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <system_error>
#include "cgroup.hpp"
#include "utils.hpp"

using namespace std;
namespace fs = std::filesystem;

bool cgroup_create(const struct runguard_options &opt) {
    try {
        cgroup_guard::init();
        cgroup_guard cg(opt.cgroupname);

        // 初始化 memory 资源管控器
        cgroup_ctrl ctrl = cg.add_controller("memory");

        if (opt.memory_limit > 0) {
            // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
            if (cgroup_guard::unified()) {
                ctrl.add_value("memory.max", opt.memory_limit);
                ctrl.add_value("memory.swap.max", (int64_t)0);
            } else {
                ctrl.add_value("memory.limit_in_bytes", opt.memory_limit);
                ctrl.add_value("memory.memsw.limit_in_bytes", opt.memory_limit);
            }
        }

        // 我们要统计选手程序的运行时间
        cg.add_controller(cgroup_guard::unified() ? "cpu" : "cpuacct");

        cg.create_cgroup(1);
        return true;
    } catch (cgroup_exception &ex) {
        LOG(WARNING) << "cgroup unavailable, falling back to rlimit: " << ex.what();
        return false;
    }
}

void cgroup_attach(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.get_cgroup();
    cg.attach_task();
}

void cgroup_kill(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);

    // 进程可能在我们杀死其他进程时继续 fork，因此重复直到 cgroup 为空
    for (int round = 0; round < 10; ++round) {
        vector<int> pids = cg.tasks("memory");
        if (pids.empty()) return;
        for (int pid : pids) kill(pid, SIGKILL);
        usleep(10 * 1000);
    }
    LOG(ERROR) << "processes still alive in cgroup " << opt.cgroupname;
}

void cgroup_delete(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.add_controller(cgroup_guard::unified() ? "cpu" : "cpuacct");
    cg.add_controller("memory");
    cg.delete_cgroup();
}

static void write_proc_file(const string &path, const string &content) {
    ofstream fout(path);
    fout << content;
    fout.close();
    if (!fout) throw system_error(errno, generic_category(), "writing " + path);
}

bool isolate_namespaces() {
    /*
     * unshare 函数可以用来进行进程隔离，我们通过 unshare 来避免 runguard 及受控程序
     * 访问评测系统打开的文件以及主机的网络、IPC。
     * 
     * CLONE_FILES：隔离文件描述符表
     * CLONE_NEWIPC：隔离 IPC 命名空间，受控程序无法再与主机程序进行进程间通信
     * CLONE_NEWNET：隔离网络命名空间，新的网络命名空间只有一个未启用的 lo，受控程序无法访问网络
     * CLONE_NEWNS: 隔离挂载命名空间
     * CLONE_NEWPID: 隔离 PID 命名空间，之后 fork 出的受控程序是新命名空间的 init 进程，
     *               它退出时内核杀死命名空间中的所有进程，包括调用了 setsid 的后代进程
     * CLONE_NEWUTS: 隔离 hostname 和 NIS
     * CLONE_SYSVSEM：不共享 System V 信号量的 undo 列表
     */
    int flags = CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWUTS | CLONE_SYSVSEM;
    if (unshare(flags) == 0) return true;

    if (geteuid() == 0) {
        LOG(WARNING) << "unshare failed: " << strerror(errno);
        return false;
    }

    // 没有 root 权限时，先进入新的用户命名空间，这样我们在新命名空间中拥有创建其他命名空间的能力
    uid_t uid = getuid();
    gid_t gid = getgid();
    if (unshare(flags | CLONE_NEWUSER) != 0) {
        LOG(WARNING) << "unshare with user namespace failed: " << strerror(errno);
        return false;
    }

    try {
        // 保持 uid/gid 不变，文件权限检查与命名空间外一致
        write_proc_file("/proc/self/setgroups", "deny");
        write_proc_file("/proc/self/uid_map", fmt::format("{} {} 1", uid, uid));
        write_proc_file("/proc/self/gid_map", fmt::format("{} {} 1", gid, gid));
    } catch (system_error &ex) {
        LOG(WARNING) << "unable to map user namespace ids: " << ex.what();
        return false;
    }
    return true;
}

static void do_mount(const string &source, const string &target, const char *fstype, unsigned long flags, const char *data) {
    if (mount(source.c_str(), target.c_str(), fstype, flags, data) != 0)
        throw system_error(errno, generic_category(), fmt::format("unable to mount {} on {}", source, target));
}

/**
 * @brief 只读绑定挂载
 * 在用户命名空间中，继承自主机的挂载点的 nosuid、nodev、noexec 和 atime 标志被锁定，
 * 重新挂载为只读时必须原样保留，否则内核返回 EPERM。
 */
static void bind_readonly(const string &source, const string &target) {
    do_mount(source, target, nullptr, MS_BIND | MS_REC, nullptr);

    unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY;
    struct statvfs st;
    if (statvfs(source.c_str(), &st) == 0) {
        if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
        if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
        if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
        if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
        if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
        if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    }
    do_mount(source, target, nullptr, flags, nullptr);
}

/**
 * @brief 将主机上的 path 以只读方式放到新的根目录下的相同位置
 * 符号链接（比如 merged-usr 系统中的 /bin -> usr/bin）原样复制，不存在的路径跳过
 */
static void mirror_readonly(const string &rootfs, const fs::path &path) {
    error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) return;

    fs::path target = rootfs + path.string();
    fs::create_directories(target.parent_path());
    if (fs::is_symlink(status)) {
        fs::create_symlink(fs::read_symlink(path), target);
    } else if (fs::is_directory(status)) {
        fs::create_directory(target);
        bind_readonly(path, target);
    } else {
        // 绑定挂载单个文件需要一个已经存在的文件作为挂载点
        ofstream touch(target);
        touch.close();
        bind_readonly(path, target);
    }
}

// 编译器和解释器运行时需要的 /etc 文件，其余的 /etc 内容对选手程序不可见
static const char *ETC_ENTRIES[] = {
    "alternatives", "group", "ld.so.cache", "ld.so.conf", "ld.so.conf.d",
    "localtime", "nsswitch.conf", "passwd", "ssl"};

static bool is_etc_entry(const string &name) {
    for (const char *entry : ETC_ENTRIES)
        if (name == entry) return true;
    // Debian 的 JDK 把配置目录放在 /etc/java-*-openjdk
    return name.compare(0, 4, "java") == 0;
}

static void setup_devices(const string &rootfs) {
    string dev = rootfs + "/dev";
    fs::create_directory(dev);
    do_mount("tmpfs", dev, "tmpfs", MS_NOSUID | MS_NOEXEC, "size=64k,mode=755");
    for (const char *name : {"null", "zero", "full", "random", "urandom"}) {
        string source = string("/dev/") + name;
        if (access(source.c_str(), F_OK) != 0) continue;
        string target = dev + "/" + name;
        ofstream touch(target);
        touch.close();
        do_mount(source, target, nullptr, MS_BIND, nullptr);
    }
    fs::create_symlink("/proc/self/fd", dev + "/fd");
    fs::create_symlink("/proc/self/fd/0", dev + "/stdin");
    fs::create_symlink("/proc/self/fd/1", dev + "/stdout");
    fs::create_symlink("/proc/self/fd/2", dev + "/stderr");
}

void setup_filesystem(const struct runguard_options &opt) {
    const string &rootfs = opt.rootfs;

    // runguard 和子进程共享 isolate_namespaces 创建的挂载命名空间，
    // 子进程再创建一个自己的，pivot_root 不会改变 runguard 看到的根目录
    if (unshare(CLONE_NEWNS) != 0)
        throw system_error(errno, generic_category(), "unable to unshare mount namespace");

    // 将根文件系统设为 private，防止挂载传播回主机
    do_mount("none", "/", nullptr, MS_REC | MS_PRIVATE, nullptr);
    do_mount("tmpfs", rootfs, "tmpfs", MS_NOSUID | MS_NODEV, "size=1m,mode=755");

    for (const char *dir : {"/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64", "/libx32", "/opt"})
        mirror_readonly(rootfs, dir);

    fs::create_directory(rootfs + "/etc");
    for (auto &entry : fs::directory_iterator("/etc"))
        if (is_etc_entry(entry.path().filename().string()))
            mirror_readonly(rootfs, entry.path());

    fs::create_directory(rootfs + "/tmp");
    do_mount("tmpfs", rootfs + "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, "size=64m,mode=1777");

    setup_devices(rootfs);

    // 新的 PID 命名空间需要自己的 /proc，JVM 等运行时会读取 /proc/self
    fs::create_directory(rootfs + "/proc");
    if (mount("proc", (rootfs + "/proc").c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0)
        LOG(WARNING) << "unable to mount /proc in sandbox: " << strerror(errno);

    // 工作目录挂载在与主机相同的路径，在 /tmp 之后挂载，因为它可能位于 /tmp 下
    if (!opt.work_dir.empty()) {
        string target = rootfs + opt.work_dir;
        fs::create_directories(target);
        do_mount(opt.work_dir, target, nullptr, MS_BIND | MS_REC, nullptr);
    }

    string old_root = rootfs + "/.old_root";
    fs::create_directory(old_root);

    // 从这里开始进程的根目录已经改变，失败时不能再退回主机的文件系统
    if (syscall(SYS_pivot_root, rootfs.c_str(), old_root.c_str()) == 0) {
        if (chdir("/") != 0)
            throw runtime_error(fmt::format("unable to chdir to new root: {}", strerror(errno)));
        if (umount2("/.old_root", MNT_DETACH) != 0)
            throw runtime_error(fmt::format("unable to detach old root: {}", strerror(errno)));
        if (rmdir("/.old_root") != 0)
            LOG(WARNING) << "unable to remove /.old_root: " << strerror(errno);
    } else {
        // 根目录不是挂载点时 (比如 runguard 运行在 chroot 中) pivot_root 返回 EINVAL
        LOG(WARNING) << "pivot_root failed, falling back to chroot: " << strerror(errno);
        if (chroot(rootfs.c_str()) != 0)
            throw runtime_error(fmt::format("unable to chroot to {}: {}", rootfs, strerror(errno)));
        if (chdir("/") != 0)
            throw runtime_error(fmt::format("unable to chdir to new root: {}", strerror(errno)));
    }

    if (mount("tmpfs", "/", nullptr, MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0)
        LOG(WARNING) << "unable to remount sandbox root read-only: " << strerror(errno);

    LOG(INFO) << "pivoted to minimal root " << rootfs;
}

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), fmt::format("setrlimit({})", resource));
}

bool set_restrictions(const struct runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        char *path = getenv("PATH");
        string saved = path ? path : "/usr/local/bin:/usr/bin:/bin";
        clearenv();
        setenv("PATH", saved.c_str(), true);
    }

    for (auto &entry : opt.env) {
        std::string env = entry;
        auto idx = env.find('=');
        if (idx == string::npos) continue;
        setenv(env.substr(0, idx).c_str(), env.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
    if (!opt.cgroupname.empty() || opt.memory_limit <= 0) {
        // memory limits are handled by cgroups
        set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);
    } else {
        // RLIMIT_DATA counts heap and private writable mappings, but not the
        // address space that runtimes reserve without touching it (JVM, V8)
        set_rlimit(RLIMIT_DATA, opt.memory_limit, opt.memory_limit);
    }

    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc > 0) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // put child process in the control group
    if (!opt.cgroupname.empty()) cgroup_attach(opt);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    // set root directory and change working directory
    if (!opt.chroot_dir.empty()) {
        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");

        LOG(INFO) << "chrooted to directory " << opt.chroot_dir;
    }

    bool restricted = true;
    if (opt.chroot_dir.empty() && !opt.rootfs.empty()) {
        try {
            setup_filesystem(opt);
        } catch (system_error &ex) {
            if (opt.require_isolation) throw;
            LOG(WARNING) << "unable to restrict filesystem: " << ex.what();
            restricted = false;
        }
    }

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[10];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("you cannot run user command as root");

    // the command must not outlive runguard, even if runguard itself is killed.
    // Changing credentials clears the parent death signal, so set it last.
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0)
        throw system_error(errno, generic_category(), "unable to set parent death signal");

    return restricted;
}

bool set_seccomp(const struct runguard_options &opt) {
    if (!opt.no_network) return true;

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) return false;

    // AF_UNIX is kept: runtimes use it locally, and the network namespace
    // already has no usable interface
    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1, SCMP_A0(SCMP_CMP_NE, AF_UNIX));
    if (rc == 0) rc = seccomp_load(ctx);
    seccomp_release(ctx);
    if (rc != 0) {
        LOG(WARNING) << "unable to load seccomp filter: " << strerror(-rc);
        return false;
    }
    return true;
}
