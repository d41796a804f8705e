#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

struct cgroup;
struct cgroup_controller;

struct cgroup_exception : public std::exception {
    cgroup_exception(std::string cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(std::string cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 * runguard 只使用 memory（限制内存、统计峰值内存、检测 OOM）
 * 和 cpuacct/cpu（统计 CPU 时间）两个 controller。
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, std::string value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放 libcgroup 分配的内存（不会删除内核中的 cgroup）
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称，如 /execjudge/box_1234_1600000000
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 在内核中创建这个 cgroup
     * 同时将 add_controller、add_value 添加的设定写入内核。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得指定的 controller
     * 必须是 add_controller 已添加过的或者根据 get_cgroup 从内核中获得的已有的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息。
     */
    void get_cgroup();

    /**
     * 将当前进程移入本 cgroup
     */
    void attach_task();

    /**
     * @brief 获得 cgroup 中所有进程的 pid
     */
    std::vector<int> tasks(const std::string &controller);

    /**
     * @brief 从内核中删除这个 cgroup。
     * 所有的进程都会被移入上一层的 cgroup。所有的子 cgroup 都会被删除。
     */
    void delete_cgroup();

    static void init();

    /**
     * @brief 系统是否使用 cgroup v2（unified hierarchy）
     * v1 和 v2 的参数名不同，比如内存限制在 v1 为 memory.limit_in_bytes，在 v2 为 memory.max
     */
    static bool unified();

    /**
     * @brief cgroup 在 cgroupfs 中的目录，用于读取 libcgroup 无法解析的统计文件
     */
    static std::string fs_path(const std::string &controller, const std::string &cgroup_name);

private:
    struct cgroup *cg;
};
