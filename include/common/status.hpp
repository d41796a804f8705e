#pragma once

namespace execjudge {

/**
 * @brief 表示单个测试点或整个提交的评测结果
 */
enum class status {
    /**
     * @brief 选手程序通过本测试点，或者所有测试点都通过
     * 对于 run_once，表示程序正常退出（退出码为 0）
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 输出去掉首尾空白字符后与标准输出不完全一致。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序运行时间超出限制
     * 包括单个测试点的时钟时间超限、CPU 时间超限，以及整个评测任务超出总截止时间。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 选手程序运行内存超限
     * cgroup 可用时通过 OOM 事件判断；否则是尽力而为的判断：
     * 程序异常退出且 stderr 包含该语言的内存耗尽标志，或者峰值内存接近上限。
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 选手程序以非零退出码退出、因信号崩溃，或者无法启动
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 选手程序编译错误
     */
    COMPILATION_ERROR = 5,

    /**
     * @brief 内部错误，评测系统出错
     * 比如 runguard 无法启动、临时目录无法创建，与选手代码无关。
     */
    SYSTEM_ERROR = 6
};

const char *get_display_message(status);

}  // namespace execjudge
