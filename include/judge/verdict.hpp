#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace execjudge {

enum class comparison {
    MATCH,
    MISMATCH
};

/**
 * @brief 比较标准输出和选手输出
 * 只去掉首尾的空白字符，中间的空白字符必须完全一致，不做数值比较。
 * 比如 " 5\n" 与 "5" 一致，"5 6" 与 "56" 不一致。
 */
comparison compare(const std::string &expected, const std::string &actual);

/**
 * @brief 单个测试点或整个提交的判定
 */
struct verdict {
    status kind = status::ACCEPTED;

    /**
     * @brief 给选手看的诊断信息
     * Compile Error 为编译器输出，Runtime Error 为 stderr，
     * Wrong Answer 为 "Expected: <e>\nActual: <a>"
     */
    std::string message;

    /**
     * @brief Wrong Answer 时的标准输出和选手输出（已去掉首尾空白）
     */
    std::string expected, actual;

    static verdict accepted();
    static verdict wrong_answer(const std::string &expected, const std::string &actual);
    static verdict time_limit_exceeded();
    static verdict memory_limit_exceeded();
    static verdict runtime_error(const std::string &message);
    static verdict compile_error(const std::string &message);
    static verdict system_error(const std::string &message);
};

void to_json(nlohmann::json &j, const verdict &v);

}  // namespace execjudge
