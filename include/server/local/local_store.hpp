#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include "server/collaborators.hpp"

/**
 * 单机部署使用的协作者实现
 * 题目从 JSON 文件读取，提交记录以 JSON 文件保存，统计信息保存在内存中。
 */
namespace execjudge::server::local {

/**
 * @brief 从目录读取题目，每个题目一个 <id>.json 文件
 * @code{.json}
 * {
 *     "title": "Two Sum",
 *     "difficulty": "Easy",
 *     "examples": [{"input": "[2,7,11,15]\n9", "output": "[0,1]"}],
 *     "test_cases": [
 *         {"input": "[2,7,11,15]\n9", "expected_output": "[0,1]", "is_hidden": false}
 *     ]
 * }
 * @endcode
 */
struct local_problem_repository : public problem_repository {
    explicit local_problem_repository(const std::filesystem::path &problem_dir);

    problem find_problem(const std::string &id) override;

    void record_submission(const std::string &id, bool accepted) override;

    /**
     * @brief 题目的提交数和通过数
     */
    std::pair<std::size_t, std::size_t> counters(const std::string &id);

private:
    std::filesystem::path problem_dir;
    std::mutex mut;
    std::map<std::string, std::pair<std::size_t, std::size_t>> submission_counters;
};

/**
 * @brief 把题目 JSON 解析为 problem
 * @throw std::invalid_argument 如果格式不正确
 */
problem parse_problem(const std::string &id, const nlohmann::json &j);

/**
 * @brief 把提交记录保存为 <submission_dir>/<uuid>.json
 * 启动时读取已有的记录，恢复用户已经通过的题目。
 */
struct local_submission_store : public submission_store {
    explicit local_submission_store(const std::filesystem::path &submission_dir);

    std::string save(const submission_record &record) override;

    bool mark_first_accepted(const std::string &user_id, const std::string &problem_id) override;

private:
    std::filesystem::path submission_dir;
    std::mutex mut;
    std::set<std::pair<std::string, std::string>> first_accepted;
};

struct solved_counters {
    std::size_t total = 0, easy = 0, medium = 0, hard = 0;
};

/**
 * @brief 内存中的用户统计信息
 */
struct memory_user_statistics : public user_statistics {
    void record_solved(const std::string &user_id, difficulty level) override;

    solved_counters get(const std::string &user_id);

private:
    std::mutex mut;
    std::map<std::string, solved_counters> users;
};

}  // namespace execjudge::server::local
