#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    // 为空时不使用 cgroup，内存限制由 RLIMIT_DATA 实现
    std::string cgroupname;
    std::string chroot_dir;
    // 未指定 chroot_dir 时，子进程在这个空目录上构建最小的根文件系统，为空时不限制文件系统
    std::string rootfs;
    std::string work_dir;
    size_t nproc = 0;  // 0 means no RLIMIT_NPROC
    int user_id = -1;
    int group_id = -1;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Output file size limit in bytes
    int64_t stream_size = -1;   // Truncate stdout/stderr at this size in bytes
    bool no_core_dumps = false;

    bool no_network = false;
    bool require_isolation = false;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
