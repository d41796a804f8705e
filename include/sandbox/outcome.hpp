#pragma once

#include <string>
#include <variant>

/**
 * 单次沙箱执行的结果
 * execution_outcome 是以下几种结果之一，由 isolated_runner 产生，之后不再修改。
 */
namespace execjudge {

/**
 * @brief 程序运行结束（无论退出码是否为 0）
 */
struct completed {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 运行阶段的时钟时间，不包含编译时间
     * 单位为毫秒
     */
    double elapsed_ms = 0;

    /**
     * @brief 运行阶段的峰值内存
     * 单位为 MB
     */
    double peak_memory_mb = 0;

    /**
     * @brief 峰值内存无法测量，peak_memory_mb 为内存上限（保守的估计值）
     */
    bool memory_estimated = false;
};

/**
 * @brief 超出时钟时间或 CPU 时间限制，或者评测任务被取消
 */
struct timed_out {
    double elapsed_ms = 0;
};

/**
 * @brief 超出内存限制
 * 这是尽力而为的判断，见 isolated_runner 的说明
 */
struct memory_exceeded {
    double peak_memory_mb = 0;
};

/**
 * @brief 编译失败，message 为编译器输出（已去掉主机路径）
 */
struct compile_failed {
    std::string message;
};

/**
 * @brief 选手程序无法启动，比如解释器不存在
 */
struct launch_failed {
    std::string message;
};

/**
 * @brief 沙箱内部错误，与选手代码无关
 * message 不包含主机路径和调用栈，详细信息只记录在日志中
 */
struct internal_failure {
    std::string message;
};

typedef std::variant<completed, timed_out, memory_exceeded, compile_failed, launch_failed, internal_failure> execution_outcome;

}  // namespace execjudge
