#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "language.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/outcome.hpp"

namespace execjudge {

/**
 * @brief 单次执行的资源限制（未乘以语言倍数）
 */
struct execution_limits {
    /**
     * @brief 单位为秒
     */
    double time_limit = 5;

    /**
     * @brief 单位为 MB
     */
    int memory_limit = 128;
};

/**
 * @brief 已经写入源代码（并编译完成）的程序
 * 持有独占的临时目录，析构时删除，可以在多个测试点之间复用编译产物。
 */
struct prepared_program {
    virtual ~prepared_program() = default;

    virtual const language_profile &profile() const = 0;
};

typedef std::variant<std::unique_ptr<prepared_program>, execution_outcome> prepare_result;

/**
 * @brief 沙箱执行器
 * 所有语言都通过同一个 {编译（可选），运行} 的约定执行。
 * 实现必须可以被多个 worker 并发调用。
 */
struct executor {
    virtual ~executor() = default;

    /**
     * @brief 创建临时目录，写入源代码，对编译型语言执行编译
     * @return 成功时返回 prepared_program，编译失败或沙箱错误时返回对应的 execution_outcome
     */
    virtual prepare_result prepare(const language_profile &profile, const std::string &source_code, const cancellation_token *cancel) = 0;

    /**
     * @brief 以 stdin 为标准输入运行程序一次
     * 不会抛出异常，所有错误都转换为 execution_outcome
     */
    virtual execution_outcome execute(prepared_program &program, const std::string &stdin_text, const execution_limits &limits, const cancellation_token *cancel) = 0;

    /**
     * @brief prepare 之后 execute，用于只运行一次的场景
     */
    execution_outcome run(const language_profile &profile, const std::string &source_code, const std::string &stdin_text, const execution_limits &limits, const cancellation_token *cancel = nullptr);
};

}  // namespace execjudge
