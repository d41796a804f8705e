#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序
 * @note 该函数必须在 main 函数最后调用，runguard 必须是单线程的
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 创建 cgroup，并注册 memory、cpu 资源管控器，限制内存使用；cgroup 不可用时退化为 rlimit
 * 3. 分离 IPC、NET、NS、UTS 等命名空间（没有 root 权限时先分离 USER 命名空间），限制子进程树的访问权
 * 4. 调用 fork 创建子进程，并等待子进程结束
 *    1. 对于父进程
 *       1. 监听 SIGALRM 来进行时间限制、SIGTERM 来清除进程树
 *       2. 创建 itimer 来限制 real time，在遇到 SIGALRM 时终止子进程组并记录信息到 meta 文件中
 *       3. 与子进程建立管道连接，将输出重定向到文件，超出 stream_size 的输出被丢弃
 *       4. 等待子进程结束
 *    2. 对于子进程，添加子进程资源限制，并与父进程建立管道重定向输入输出
 *       1. 清除环境变量，只保留 PATH
 *       2. 通过 rlimit 限制 CPU time、输出文件大小、进程数，cgroup 不可用时限制 RLIMIT_DATA
 *       3. 将子进程挂载到我们创建的 cgroup 上
 *       4. 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       5. 设置 chroot 和工作路径，设置子进程的 user 和 group
 *       6. 加载 seccomp 过滤器，禁止创建网络套接字
 *       7. 任何一步失败都通过 CLOEXEC 管道告知父进程
 * 5. 检查子进程是否正常退出
 *     1. 若因为信号终止，且为 SIGXCPU 则 Time Limit Exceeded
 *     2. 其他信号由调用者根据 meta 文件判断
 * 6. 读取 cgroup 的监测数据（或者 rusage），得到运行时间、峰值内存、是否发生 OOM
 * 7. 杀死进程组和 cgroup 内的所有进程确保选手 fork 出来的子进程都不会留驻系统
 * 8. 删除创建的 cgroup，并记录所有的信息到 meta 文件中
 * @return 子进程的退出码，被信号终止时为 128 + 信号
 */
int runit(struct runguard_options opt);
