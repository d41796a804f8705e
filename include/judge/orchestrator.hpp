#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "judge/submission.hpp"
#include "sandbox/executor.hpp"

namespace execjudge {

/**
 * @brief 测试点调度器
 * 按给定顺序逐个运行测试点，遇到第一个未通过的测试点立即停止。
 * 编译型语言只编译一次，编译产物在所有测试点间复用。
 * 同一提交的测试点不会并行执行，不同提交可以在不同 worker 中并发调用同一个 orchestrator。
 */
struct orchestrator {
    orchestrator(executor &exec, const engine_config &config);

    /**
     * @brief 评测一个提交
     * @param language 语言标识符
     * @param cancel 评测任务的取消标记，被取消后以 Time Limit Exceeded 结束
     * @throw unsupported_language 在分配任何沙箱资源之前
     */
    submission_result evaluate(const std::string &language, const std::string &source_code, const std::vector<test_case> &cases,
                               const execution_limits &limits, const cancellation_token *cancel = nullptr) const;

    submission_result evaluate(const std::string &language, const std::string &source_code, const std::vector<test_case> &cases) const;

    /**
     * @brief 以 stdin_text 为输入运行一次，不比较输出
     * 退出码为 0 时 status 为 Accepted，否则为对应的错误分类
     * @throw unsupported_language 在分配任何沙箱资源之前
     */
    run_result run_once(const std::string &language, const std::string &source_code, const std::string &stdin_text,
                        const execution_limits &limits, const cancellation_token *cancel = nullptr) const;

    run_result run_once(const std::string &language, const std::string &source_code, const std::string &stdin_text) const;

    /**
     * @brief 配置中的默认资源限制
     */
    execution_limits default_limits() const;

private:
    executor &exec;
    const engine_config &config;
};

/**
 * @brief 将除了 completed 以外的执行结果映射为判定
 * completed 需要比较输出，由调用者处理
 */
verdict classify_failure(const execution_outcome &outcome);

}  // namespace execjudge
