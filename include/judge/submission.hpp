#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "judge/verdict.hpp"

namespace execjudge {

/**
 * @brief 测试点，由题目提供，评测过程中只读
 */
struct test_case {
    std::string input;

    std::string expected_output;

    /**
     * @brief 隐藏测试点
     * 用于评分，但其他测试点失败时不会返回它的标准输出。
     * 如果失败的正是这个测试点，仍然返回标准输出和选手输出。
     */
    bool hidden = false;
};

/**
 * @brief 题目的样例，供 run_once 和没有测试点的题目使用
 */
struct example {
    std::string input;
    std::string output;
};

/**
 * @brief 一次提交的评测结果
 * 满足 passed_count <= total_count；若 verdict 不是 Accepted，
 * passed_count 为第一个未通过的测试点之前的测试点数。
 */
struct submission_result {
    struct verdict verdict;

    std::size_t passed_count = 0;

    /**
     * @brief 测试点总数，在评测开始前确定
     */
    std::size_t total_count = 0;

    /**
     * @brief 通过的测试点的平均运行时间
     * 单位为毫秒
     */
    double runtime_ms = 0;

    /**
     * @brief 通过的测试点中最长的运行时间
     * 单位为毫秒
     */
    double max_runtime_ms = 0;

    /**
     * @brief 所有执行过的测试点中的峰值内存
     * 单位为 MB
     */
    double memory_mb = 0;

    /**
     * @brief 峰值内存无法测量，memory_mb 为内存上限
     */
    bool memory_estimated = false;

    /**
     * @brief 第一个未通过的测试点下标（从 0 开始），Accepted 时为空
     */
    std::optional<std::size_t> failed_case;

    bool failed_case_hidden = false;
};

/**
 * @brief run_once 的结果
 */
struct run_result {
    status result = status::ACCEPTED;

    /**
     * @brief 选手程序的 stdout（已去掉首尾空白）
     */
    std::string output;

    std::optional<double> runtime_ms;

    std::optional<double> memory_mb;

    std::optional<std::string> error_message;
};

void to_json(nlohmann::json &j, const submission_result &result);

void to_json(nlohmann::json &j, const run_result &result);

}  // namespace execjudge
