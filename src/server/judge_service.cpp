#include "server/judge_service.hpp"
#include <glog/logging.h>
#include <cmath>
#include <ctime>
#include "common/exceptions.hpp"

namespace execjudge::server {
using namespace std;

// 取消正在运行的任务后，等待沙箱进程组被清理的时间
static const auto CANCEL_GRACE = chrono::seconds(5);

judge_service::judge_service(const engine_config &config, const orchestrator &judge, job_queue &jobs,
                             problem_repository &problems, submission_store &submissions, user_statistics &stats)
    : config(config), judge(judge), jobs(jobs), problems(problems), submissions(submissions), stats(stats) {}

chrono::steady_clock::duration judge_service::job_budget(const language_profile &profile, size_t cases) const {
    double seconds = max<size_t>(cases, 1) * config.time_limit * profile.time_factor + config.job_overhead;
    if (profile.needs_compile()) seconds += config.compile_timeout;
    return chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(seconds));
}

size_t judge_service::jobs_ahead() const {
    job_stats s = jobs.stats();
    // worker 可能在 accepted 增加之前就完成了任务
    return s.accepted > s.completed ? s.accepted - s.completed : 0;
}

chrono::steady_clock::duration judge_service::wait_limit(chrono::steady_clock::duration budget, size_t ahead) const {
    if (config.request_timeout > 0)
        return chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(config.request_timeout));
    // 最坏情况下前面的任务都要用满截止时间
    size_t workers = max<size_t>(config.workers, 1);
    size_t rounds = 1 + (ahead + workers - 1) / workers;
    return budget * rounds;
}

template <typename T>
T judge_service::await(future<T> &result, cancellation_token &cancel, chrono::steady_clock::duration wait) const {
    if (result.wait_for(wait) == future_status::timeout) {
        LOG(WARNING) << "Request timed out, cancelling job";
        cancel.cancel();
        // 正在运行的任务会在沙箱进程组被杀死后以超时结束；
        // 仍在排队的任务要等 worker 取出时才会被丢弃，不再等待
        if (result.wait_for(CANCEL_GRACE) == future_status::timeout)
            throw overloaded_error("Request timed out while waiting in queue");
    }
    return result.get();
}

run_result judge_service::run_once(const string &language, const string &code, const string &stdin_text) {
    const language_profile &profile = resolve(language);
    auto cancel = make_shared<cancellation_token>();
    auto budget = job_budget(profile, 1);
    size_t ahead = jobs_ahead();
    // 任务可能比 judge_service 活得更久，只引用 orchestrator
    auto result = jobs.submit([&judge = judge, language, code, stdin_text](const cancellation_token &token) {
        return judge.run_once(language, code, stdin_text, judge.default_limits(), &token);
    }, cancel, budget);
    return await(result, *cancel, wait_limit(budget, ahead));
}

submission_result judge_service::submit(const string &language, const string &code, const vector<test_case> &cases) {
    const language_profile &profile = resolve(language);
    auto cancel = make_shared<cancellation_token>();
    auto budget = job_budget(profile, cases.size());
    size_t ahead = jobs_ahead();
    auto result = jobs.submit([&judge = judge, language, code, cases](const cancellation_token &token) {
        return judge.evaluate(language, code, cases, judge.default_limits(), &token);
    }, cancel, budget);
    return await(result, *cancel, wait_limit(budget, ahead));
}

run_result judge_service::run_problem(const string &problem_id, const string &language, const string &code,
                                      const optional<string> &stdin_text) {
    problem prob = problems.find_problem(problem_id);
    string input;
    if (stdin_text)
        input = *stdin_text;
    else if (!prob.examples.empty())
        input = prob.examples.front().input;
    return run_once(language, code, input);
}

submission_record judge_service::submit_problem(const string &user_id, const string &problem_id,
                                                const string &language, const string &code) {
    problem prob = problems.find_problem(problem_id);

    vector<test_case> cases = prob.test_cases;
    if (cases.empty() && !prob.examples.empty()) {
        test_case tc;
        tc.input = prob.examples.front().input;
        tc.expected_output = prob.examples.front().output;
        cases.push_back(tc);
    }

    submission_record record;
    record.user_id = user_id;
    record.problem_id = problem_id;
    record.language = language;
    record.code = code;
    record.result = submit(language, code, cases);
    record.submitted_at = time(nullptr);
    record.id = submissions.save(record);

    bool accepted = record.result.verdict.kind == status::ACCEPTED;
    problems.record_submission(problem_id, accepted);
    if (accepted && submissions.mark_first_accepted(user_id, problem_id)) {
        LOG(INFO) << "User " << user_id << " solved " << problem_id << " for the first time";
        stats.record_solved(user_id, prob.level);
    }

    LOG(INFO) << "Submission " << record.id << " of " << problem_id << ": "
              << get_display_message(record.result.verdict.kind) << " "
              << record.result.passed_count << "/" << record.result.total_count;
    return record;
}

}  // namespace execjudge::server
