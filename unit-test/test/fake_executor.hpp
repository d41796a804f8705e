#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "sandbox/executor.hpp"

/**
 * 测试替身：不启动任何进程的执行器
 * 编译阶段可以设置为失败，运行阶段的结果由 on_execute 根据源代码和输入计算。
 * 只用于测试 orchestrator、job_queue 和 judge_service。
 */
namespace execjudge::test {

struct fake_executor : public executor {
    struct fake_program : public prepared_program {
        fake_program(const language_profile &lang, const std::string &source)
            : lang(lang), source(source) {}

        const language_profile &profile() const override {
            return lang;
        }

        const language_profile &lang;
        std::string source;
    };

    typedef std::function<execution_outcome(const std::string &source, const std::string &stdin_text, const cancellation_token *cancel)> execute_function;

    /**
     * @brief 默认原样输出 stdin
     */
    execute_function on_execute = [](const std::string &, const std::string &stdin_text, const cancellation_token *) {
        return execution_outcome(output(stdin_text));
    };

    /**
     * @brief 若设置，prepare 返回这个结果
     */
    std::optional<execution_outcome> prepare_failure;

    std::atomic<int> prepare_calls{0};
    std::atomic<int> execute_calls{0};

    prepare_result prepare(const language_profile &profile, const std::string &source_code, const cancellation_token *) override {
        ++prepare_calls;
        if (prepare_failure) return prepare_result(*prepare_failure);
        return prepare_result(std::unique_ptr<prepared_program>(std::make_unique<fake_program>(profile, source_code)));
    }

    execution_outcome execute(prepared_program &program, const std::string &stdin_text, const execution_limits &, const cancellation_token *cancel) override {
        ++execute_calls;
        return on_execute(static_cast<fake_program &>(program).source, stdin_text, cancel);
    }

    /**
     * @brief 正常退出的执行结果
     */
    static completed output(const std::string &stdout_text, double elapsed_ms = 10, int exit_code = 0, const std::string &stderr_text = "") {
        completed c;
        c.exit_code = exit_code;
        c.stdout_text = stdout_text;
        c.stderr_text = stderr_text;
        c.elapsed_ms = elapsed_ms;
        c.peak_memory_mb = 8;
        return c;
    }
};

}  // namespace execjudge::test
