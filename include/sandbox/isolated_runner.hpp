#pragma once

#include <filesystem>
#include <string>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "runguard.hpp"
#include "sandbox/executor.hpp"

namespace execjudge {

/**
 * @brief 通过 runguard 在沙箱中编译、运行选手代码
 * 
 * 每次 prepare 都创建一个新的临时目录，编译和运行都以 box/ 为工作目录，
 * 输入输出文件和 meta 文件放在选手程序看不到的 io/ 中。
 * 
 * 结果分类（尽力而为）：
 * 1. 评测任务被取消，或者超出时钟时间、CPU 时间限制：timed_out
 * 2. cgroup 报告 OOM kill：memory_exceeded
 * 3. 程序异常退出，且 stderr 包含该语言的内存耗尽标志，或者峰值内存达到上限的 90%：memory_exceeded
 *    没有 cgroup 时内存上限由 RLIMIT_DATA 实现，内存耗尽表现为分配失败后的异常退出，只能这样推断
 * 4. 其他情况为 completed，由调用者根据退出码判断是否为 Runtime Error
 * 
 * 这个类没有可变状态，可以被多个 worker 并发调用。
 */
struct isolated_runner : public executor {
    explicit isolated_runner(const engine_config &config);

    prepare_result prepare(const language_profile &profile, const std::string &source_code, const cancellation_token *cancel) override;

    execution_outcome execute(prepared_program &program, const std::string &stdin_text, const execution_limits &limits, const cancellation_token *cancel) override;

private:
    const engine_config &config;

    /**
     * @brief 调用 runguard 执行一次命令，返回 meta 文件中的监测结果
     * @param phase 本次执行的名字，决定 io/ 中的文件名
     * @param killed 返回 runguard 是否因为取消或超时被强制终止
     */
    runguard_result invoke(const scratch_directory &dir, const std::string &phase, runguard_request request, const cancellation_token *cancel, bool &killed);

    std::filesystem::path sandbox_path(const std::filesystem::path &host_path) const;
};

}  // namespace execjudge
