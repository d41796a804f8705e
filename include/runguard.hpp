#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"

namespace execjudge {

/**
 * @brief runguard 写入 meta 文件的监测结果
 * meta 文件每行为 "key: value"，缺失的键保持默认值。
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加  
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加  
     */
    double cpu_time = -1;

    /**
     * @brief 子进程的退出码，被信号终止时为 128 + 信号
     * 为 -1 表示 runguard 没能等到子进程结束
     */
    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 被监控进程的 pid，也是其进程组 id
     * runguard 自身被强制杀死时，调用者据此清理残留的进程组
     */
    int child_pid = -1;

    /**
     * @brief runguard 创建的 cgroup 在 cgroupfs 中的目录
     * runguard 正常结束时已经删除，被强制杀死时由调用者清理
     */
    std::vector<std::string> cgroup_paths;

    /**
     * @brief 沙箱自身的错误（cgroup、命名空间、setuid 等），与选手代码无关
     */
    std::string internal_error;

    /**
     * @brief 选手程序无法启动（比如 execvp 失败）
     */
    std::string launch_error;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 内存数据的来源，cgroup 或者 rusage
     */
    std::string memory_source;

    /**
     * @brief 是否发生了 cgroup OOM kill
     */
    bool oom = false;

    /**
     * @brief soft-timelimit 或者 hard-timelimit，未超时为空
     */
    std::string time_result;

    /**
     * @brief full 或者 partial
     */
    std::string isolation;

    /**
     * @brief 被截断的输出流，比如 "stdout,stderr"
     */
    std::string output_truncated;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

/**
 * @brief 单次沙箱执行的参数
 */
struct runguard_request {
    /**
     * @brief 选手程序的工作目录
     */
    std::filesystem::path work_dir;

    std::vector<std::string> command;

    /**
     * @brief 时钟时间限制，soft 用于判定超时，hard 用于强制终止
     * 单位为秒
     */
    double wall_time_soft = 0, wall_time_hard = 0;

    /**
     * @brief CPU 时间限制
     * 单位为秒，0 表示不限制
     */
    double cpu_time = 0;

    /**
     * @brief 内存限制
     * 单位为 KB
     */
    int64_t memory_limit = 0;

    std::filesystem::path stdin_file, stdout_file, stderr_file, metafile;
};

/**
 * @brief 生成调用 runguard 的完整命令行
 * 用户、chroot、输出截断、网络等与具体执行无关的选项来自配置
 */
std::vector<std::string> runguard_arguments(const engine_config &config, const runguard_request &request);

}  // namespace execjudge
