#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace execjudge {

/**
 * @brief 执行引擎的配置
 * 在进程启动时构造一次，之后以只读引用的方式传给 isolated_runner、job_queue、judge_service。
 * 
 * 配置的来源优先级（从高到低）：命令行参数、环境变量、JSON 配置文件、默认值。
 */
struct engine_config {
    /**
     * @brief 默认的单个测试点时间限制
     * 单位为秒
     */
    double time_limit = 5;

    /**
     * @brief 默认的内存限制
     * 单位为 MB
     */
    int memory_limit = 128;

    /**
     * @brief worker 线程数，每个 worker 同一时间只评测一个提交
     * 默认为主机的 CPU 核心数
     */
    std::size_t workers = 0;

    /**
     * @brief 等待队列的最大长度，超出时新的请求会立刻被拒绝（Overloaded）
     * 0 表示不限制
     */
    std::size_t queue_capacity = 64;

    /**
     * @brief 编译的时钟时间限制，与运行时间限制无关
     * 单位为秒
     */
    double compile_timeout = 10;

    /**
     * @brief 编译器的内存限制
     * 单位为 MB
     */
    int compile_memory_limit = 1024;

    /**
     * @brief stdout 和 stderr 各自最多保留多少数据，超出的部分被丢弃
     * 单位为 KB
     */
    int output_limit = 65536;

    /**
     * @brief 选手程序最多能同时存在的进程数（RLIMIT_NPROC）
     * 0 表示不限制。由于 RLIMIT_NPROC 按用户统计，只有设置了 run_user 时才有意义，
     * 此时默认为 64。
     */
    int process_limit = 0;

    /**
     * @brief 评测任务总截止时间中的固定开销
     * 总截止时间 = 所有测试点时间限制之和 + 编译时间限制 + job_overhead
     * 单位为秒
     */
    double job_overhead = 10;

    /**
     * @brief 调用者最多等待多久
     * 0 表示根据评测任务的总截止时间自动计算
     * 单位为秒
     */
    double request_timeout = 0;

    /**
     * @brief 存放所有临时目录的根目录
     * 若把这个文件夹放进内存盘，可以加速选手程序的 IO 性能。
     */
    std::filesystem::path scratch_dir;

    /**
     * @brief runguard 可执行文件的路径
     */
    std::filesystem::path runguard;

    /**
     * @brief 配置好的 chroot 路径，为空时不使用 chroot
     * 目录中必须包含各语言的编译器和解释器，且 scratch_dir 必须位于 chroot_dir 之内
     */
    std::filesystem::path chroot_dir;

    /**
     * @brief 选手程序以哪个用户运行
     * 以 root 运行评测系统时，若为空则使用 nobody
     */
    std::string run_user;

    std::string run_group;

    /**
     * @brief 是否要求沙箱隔离必须生效
     * 若为真，命名空间或 seccomp 无法启用时评测以 System Error 结束；
     * 否则只记录警告并继续执行（用于没有权限的开发环境）
     */
    bool require_isolation = false;

    /**
     * @brief 是否开启 DEBUG 模式
     * 如果开启 DEBUG 模式，评测系统不会删除产生的临时目录，以便手动检查文件内容是否符合预期。
     */
    bool debug = false;
};

/**
 * @brief 返回所有选项都为默认值的配置
 * workers 为主机 CPU 核心数，scratch_dir 为 $TMPDIR/execjudge
 */
engine_config default_config();

/**
 * @brief 从 JSON 配置文件读入配置，文件中没有出现的键保持不变
 * @code{.json}
 * {
 *     "time_limit": 5,
 *     "memory_limit": 128,
 *     "workers": 4,
 *     "queue_capacity": 10,
 *     "compile_timeout": 10,
 *     "runguard": "/opt/execjudge/bin/runguard"
 * }
 * @endcode
 * @throw std::runtime_error 当文件不存在或格式错误时
 */
void load_config_file(engine_config &config, const std::filesystem::path &path);

/**
 * @brief 从环境变量读入配置（EXECJUDGE_TIME_LIMIT、RUNGUARD 等），未设置的保持不变
 */
void load_config_env(engine_config &config);

/**
 * @brief 检查配置是否合法
 * @throw std::invalid_argument 当某个选项不合法时，message 为可读的错误信息
 */
void validate_config(const engine_config &config);

}  // namespace execjudge
