#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "judge/submission.hpp"

/**
 * 执行引擎依赖的外部协作者
 * 用户、题目、提交记录的存储不属于执行引擎，这里只定义引擎需要的最小接口。
 * 实现在启动时显式构造，以引用的方式传给 judge_service，不存在全局单例。
 */
namespace execjudge::server {

enum class difficulty {
    EASY,
    MEDIUM,
    HARD
};

/**
 * @brief 解析 "Easy"、"Medium"、"Hard"（不区分大小写）
 * @throw std::invalid_argument 其他字符串
 */
difficulty parse_difficulty(const std::string &text);

const char *difficulty_name(difficulty level);

struct problem {
    std::string id;

    std::string title;

    difficulty level = difficulty::EASY;

    /**
     * @brief 评测使用的测试点，按顺序执行
     */
    std::vector<test_case> test_cases;

    /**
     * @brief 题面中的样例
     * run_problem 没有给定输入时使用第一个样例的输入；
     * 题目没有测试点时，第一个样例作为唯一的测试点
     */
    std::vector<example> examples;
};

/**
 * @brief 一条提交记录
 */
struct submission_record {
    /**
     * @brief 由 submission_store::save 分配
     */
    std::string id;

    std::string user_id;

    std::string problem_id;

    std::string language;

    std::string code;

    submission_result result;

    std::time_t submitted_at = 0;
};

void to_json(nlohmann::json &j, const submission_record &record);

/**
 * @brief 题目仓库
 */
struct problem_repository {
    virtual ~problem_repository() = default;

    /**
     * @throw not_found_error 如果题目不存在
     */
    virtual problem find_problem(const std::string &id) = 0;

    /**
     * @brief 更新题目的提交数和通过数
     */
    virtual void record_submission(const std::string &id, bool accepted) = 0;
};

/**
 * @brief 提交记录存储
 */
struct submission_store {
    virtual ~submission_store() = default;

    /**
     * @brief 保存提交记录
     * @return 新分配的提交 id
     */
    virtual std::string save(const submission_record &record) = 0;

    /**
     * @brief 原子地标记用户第一次通过该题
     * 同一用户对同一题目并发提交时，只有一次调用返回 true。
     * @return 如果这是该用户第一次通过该题
     */
    virtual bool mark_first_accepted(const std::string &user_id, const std::string &problem_id) = 0;
};

/**
 * @brief 用户统计信息
 */
struct user_statistics {
    virtual ~user_statistics() = default;

    /**
     * @brief 用户第一次通过一道题目，更新总通过数和对应难度的通过数
     */
    virtual void record_solved(const std::string &user_id, difficulty level) = 0;
};

}  // namespace execjudge::server
