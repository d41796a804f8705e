#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace execjudge {
using namespace std;

orchestrator::orchestrator(executor &exec, const engine_config &config)
    : exec(exec), config(config) {}

execution_limits orchestrator::default_limits() const {
    execution_limits limits;
    limits.time_limit = config.time_limit;
    limits.memory_limit = config.memory_limit;
    return limits;
}

/**
 * @brief 非零退出码的诊断信息，stderr 为空时给出退出码
 */
static string runtime_error_message(const completed &c) {
    string message = trim(c.stderr_text);
    if (!message.empty()) return message;
    if (c.exit_code > 128) return fmt::format("Process terminated by signal {}", c.exit_code - 128);
    return fmt::format("Process exited with code {}", c.exit_code);
}

verdict classify_failure(const execution_outcome &outcome) {
    return visit(overloaded{
                     [](const completed &c) {
                         return c.exit_code == 0 ? verdict::accepted() : verdict::runtime_error(runtime_error_message(c));
                     },
                     [](const timed_out &) { return verdict::time_limit_exceeded(); },
                     [](const memory_exceeded &) { return verdict::memory_limit_exceeded(); },
                     [](const compile_failed &c) { return verdict::compile_error(c.message); },
                     [](const launch_failed &l) { return verdict::runtime_error(l.message); },
                     [](const internal_failure &i) { return verdict::system_error(i.message); }},
                 outcome);
}

submission_result orchestrator::evaluate(const string &language, const string &source_code, const vector<test_case> &cases) const {
    return evaluate(language, source_code, cases, default_limits());
}

submission_result orchestrator::evaluate(const string &language, const string &source_code, const vector<test_case> &cases,
                                         const execution_limits &limits, const cancellation_token *cancel) const {
    const language_profile &profile = resolve(language);

    submission_result result;
    result.total_count = cases.size();

    if (cases.empty()) {
        result.verdict = verdict::accepted();
        return result;
    }

    auto fail = [&](size_t index, struct verdict v) {
        result.verdict = move(v);
        result.failed_case = index;
        result.failed_case_hidden = cases[index].hidden;
        LOG(INFO) << "Submission failed at test case " << index << ": " << get_display_message(result.verdict.kind);
        return result;
    };

    prepare_result prepared = exec.prepare(profile, source_code, cancel);
    if (auto outcome = get_if<execution_outcome>(&prepared)) {
        // 编译失败与具体测试点无关
        result.verdict = classify_failure(*outcome);
        return result;
    }
    prepared_program &program = *get<unique_ptr<prepared_program>>(prepared);

    double total_runtime = 0;
    for (size_t i = 0; i < cases.size(); ++i) {
        // 评测任务超出总截止时间，剩余的测试点不再运行
        if (cancel && cancel->cancelled())
            return fail(i, verdict::time_limit_exceeded());

        execution_outcome outcome = exec.execute(program, cases[i].input, limits, cancel);

        if (auto c = get_if<completed>(&outcome)) {
            result.memory_mb = max(result.memory_mb, c->peak_memory_mb);
            result.memory_estimated |= c->memory_estimated;
            if (c->exit_code != 0)
                return fail(i, classify_failure(outcome));
            if (compare(cases[i].expected_output, c->stdout_text) == comparison::MISMATCH)
                return fail(i, verdict::wrong_answer(cases[i].expected_output, c->stdout_text));

            ++result.passed_count;
            total_runtime += c->elapsed_ms;
            result.runtime_ms = total_runtime / result.passed_count;
            result.max_runtime_ms = max(result.max_runtime_ms, c->elapsed_ms);
        } else {
            if (auto m = get_if<memory_exceeded>(&outcome))
                result.memory_mb = max(result.memory_mb, m->peak_memory_mb);
            return fail(i, classify_failure(outcome));
        }
    }

    result.verdict = verdict::accepted();
    result.verdict.message = fmt::format("All test cases passed!\nAverage Runtime: {:.2f}ms", result.runtime_ms);
    return result;
}

run_result orchestrator::run_once(const string &language, const string &source_code, const string &stdin_text) const {
    return run_once(language, source_code, stdin_text, default_limits());
}

run_result orchestrator::run_once(const string &language, const string &source_code, const string &stdin_text,
                                  const execution_limits &limits, const cancellation_token *cancel) const {
    const language_profile &profile = resolve(language);
    execution_outcome outcome = exec.run(profile, source_code, stdin_text, limits, cancel);

    run_result result;
    verdict v = classify_failure(outcome);
    result.result = v.kind;
    if (auto c = get_if<completed>(&outcome)) {
        result.output = trim(c->stdout_text);
        result.runtime_ms = c->elapsed_ms;
        result.memory_mb = c->peak_memory_mb;
    }
    if (v.kind != status::ACCEPTED) result.error_message = v.message;
    return result;
}

}  // namespace execjudge
