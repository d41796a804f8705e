#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "runguard.hpp"
#include "sandbox/cancellation.hpp"

namespace execjudge {

struct process_result {
    /**
     * @brief 外部命令的退出码，如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 外部命令是否因为取消标记或 timeout 被强制终止
     */
    bool killed = false;
};

/**
 * @brief 执行 runguard，并等待它结束
 * 等待期间轮询取消标记和 timeout，一旦触发先发送 SIGTERM 让 runguard 清理进程组，
 * 宽限期后仍未退出则 SIGKILL，并根据 meta 文件杀死残留的进程组和 cgroup 中的进程。
 * 函数返回时保证没有被监控的进程残留。
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param log_file 外部命令的 stdout 和 stderr 重定向到这个文件，stdin 为 /dev/null
 * @param metafile runguard 的 meta 文件
 * @param timeout 最多等待多少秒
 * @param cancel 取消标记，可以为空
 * @throw std::system_error 如果 fork 失败或者日志文件无法打开
 */
/**
 * @brief 杀死 runguard 没能清理的进程
 * 杀死 child-pid 对应的进程组，以及 cgroup 目录中 cgroup.procs 列出的所有进程，然后删除 cgroup。
 * 已经不存在的进程组和 cgroup 被忽略。
 */
void kill_leftovers(const runguard_result &result);

process_result exec_program(const std::vector<std::string> &argv,
                            const std::filesystem::path &log_file,
                            const std::filesystem::path &metafile,
                            double timeout,
                            const cancellation_token *cancel);

}  // namespace execjudge
