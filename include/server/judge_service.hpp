#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/orchestrator.hpp"
#include "server/collaborators.hpp"
#include "worker.hpp"

namespace execjudge::server {

/**
 * @brief 执行引擎对外的接口
 * 所有评测都通过 job_queue 在 worker 中执行，调用者同步等待结果，
 * 等待时间有上限：超时后任务被取消，尚未开始的任务以 overloaded_error 结束，
 * 正在运行的任务以 Time Limit Exceeded 结束。
 * 
 * 可以被多个线程并发调用。
 */
struct judge_service {
    judge_service(const engine_config &config, const orchestrator &judge, job_queue &jobs,
                  problem_repository &problems, submission_store &submissions, user_statistics &stats);

    /**
     * @brief 以 stdin_text 为输入运行一次，不比较输出
     * @throw unsupported_language 在任务入队之前
     * @throw overloaded_error 如果评测队列已满
     */
    run_result run_once(const std::string &language, const std::string &code, const std::string &stdin_text);

    /**
     * @brief 以给定的测试点评测代码，不保存提交记录
     * @throw unsupported_language 在任务入队之前
     * @throw overloaded_error 如果评测队列已满
     */
    submission_result submit(const std::string &language, const std::string &code, const std::vector<test_case> &cases);

    /**
     * @brief 对题目运行一次代码
     * stdin_text 为空时使用题目第一个样例的输入，没有样例时输入为空
     * @throw not_found_error 如果题目不存在
     */
    run_result run_problem(const std::string &problem_id, const std::string &language, const std::string &code,
                           const std::optional<std::string> &stdin_text);

    /**
     * @brief 评测用户对题目的提交，并保存提交记录、更新统计信息
     * 题目没有测试点时使用第一个样例作为唯一的测试点。
     * 用户第一次通过该题时（由 submission_store::mark_first_accepted 原子地判断）更新用户统计信息。
     * @throw not_found_error 如果题目不存在
     */
    submission_record submit_problem(const std::string &user_id, const std::string &problem_id,
                                     const std::string &language, const std::string &code);

private:
    const engine_config &config;
    const orchestrator &judge;
    job_queue &jobs;
    problem_repository &problems;
    submission_store &submissions;
    user_statistics &stats;

    /**
     * @brief 评测任务的总截止时间
     * 所有测试点的时间限制（乘以语言倍数）之和 + 编译时间限制 + 固定开销
     */
    std::chrono::steady_clock::duration job_budget(const language_profile &profile, std::size_t cases) const;

    /**
     * @brief 已经进入队列但还没有结束的任务数，包括正在执行的任务
     */
    std::size_t jobs_ahead() const;

    /**
     * @brief 调用者最多等待多久
     * 未配置 request_timeout 时，按入队时排在前面的任务数估计：
     * 前面的任务分给所有 worker，每一轮都按本任务的截止时间计算。
     * @param ahead 入队时排在前面的任务数
     */
    std::chrono::steady_clock::duration wait_limit(std::chrono::steady_clock::duration budget, std::size_t ahead) const;

    template <typename T>
    T await(std::future<T> &result, cancellation_token &cancel, std::chrono::steady_clock::duration wait) const;
};

}  // namespace execjudge::server
