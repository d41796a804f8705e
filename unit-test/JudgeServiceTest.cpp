#include <atomic>
#include <filesystem>
#include <future>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "server/judge_service.hpp"
#include "server/local/local_store.hpp"
#include "test/environment.hpp"
#include "test/fake_executor.hpp"

using namespace std;
using namespace execjudge;
using namespace execjudge::server;
using execjudge::test::fake_executor;
namespace fs = std::filesystem;

/**
 * 使用假的执行器和本地存储测试 judge_service，不启动任何沙箱
 * 假执行器原样输出 stdin，因此 "echo" 形式的提交总能通过输入与输出相同的测试点
 */
class JudgeServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::unique_temp_dir("execjudge-service");
        fs::create_directories(dir / "problems");
        write_file_content(dir / "problems" / "echo.json", R"({
            "title": "Echo",
            "difficulty": "Medium",
            "examples": [{"input": "hello", "output": "hello"}],
            "test_cases": [
                {"input": "1", "expected_output": "1"},
                {"input": "2", "expected_output": "2", "is_hidden": true}
            ]
        })");
        write_file_content(dir / "problems" / "examples-only.json", R"({
            "title": "Sum",
            "difficulty": "Hard",
            "examples": [{"input": "1 2", "output": "3"}]
        })");

        config = test::test_config(dir / "scratch");
        config.workers = 4;
        config.queue_capacity = 32;
        judge = make_unique<orchestrator>(exec, config);
        jobs = make_unique<job_queue>(config.workers, config.queue_capacity);
        problems = make_unique<local::local_problem_repository>(dir / "problems");
        submissions = make_unique<local::local_submission_store>(dir / "submissions");
        service = make_unique<judge_service>(config, *judge, *jobs, *problems, *submissions, stats);
    }

    void TearDown() override {
        service.reset();
        jobs.reset();
        fs::remove_all(dir);
    }

    fs::path dir;
    engine_config config;
    fake_executor exec;
    unique_ptr<orchestrator> judge;
    unique_ptr<job_queue> jobs;
    unique_ptr<local::local_problem_repository> problems;
    unique_ptr<local::local_submission_store> submissions;
    local::memory_user_statistics stats;
    unique_ptr<judge_service> service;
};

TEST_F(JudgeServiceTest, SubmitWithCases) {
    test_case tc;
    tc.input = "[2,7,11,15]\n9";
    tc.expected_output = "[2,7,11,15]\n9\n";
    submission_result result = service->submit("python", "", {tc, tc});
    EXPECT_EQ(result.verdict.kind, status::ACCEPTED);
    EXPECT_EQ(result.passed_count, 2u);
    EXPECT_EQ(result.total_count, 2u);

    run_result run = service->run_once("cpp", "", "  42\n");
    EXPECT_EQ(run.result, status::ACCEPTED);
    EXPECT_EQ(run.output, "42");
}

TEST_F(JudgeServiceTest, UnsupportedLanguageIsNotQueued) {
    EXPECT_THROW(service->submit("cobol", "", {}), unsupported_language);
    EXPECT_THROW(service->run_once("cobol", "", ""), unsupported_language);
    EXPECT_EQ(jobs->stats().accepted, 0u);
}

TEST_F(JudgeServiceTest, ProblemNotFound) {
    EXPECT_THROW(service->submit_problem("alice", "missing", "python", ""), not_found_error);
    EXPECT_THROW(service->run_problem("../echo", "python", "", nullopt), not_found_error);
    EXPECT_EQ(exec.prepare_calls, 0);
}

TEST_F(JudgeServiceTest, RunProblemUsesFirstExample) {
    EXPECT_EQ(service->run_problem("echo", "python", "", nullopt).output, "hello");
    EXPECT_EQ(service->run_problem("echo", "python", "", string("custom")).output, "custom");
}

TEST_F(JudgeServiceTest, ExampleIsTheOnlyCase) {
    exec.on_execute = [](const string &, const string &stdin_text, const cancellation_token *) {
        return execution_outcome(fake_executor::output(stdin_text == "1 2" ? "3\n" : "0\n"));
    };
    submission_record record = service->submit_problem("bob", "examples-only", "javascript", "");
    EXPECT_EQ(record.result.verdict.kind, status::ACCEPTED);
    EXPECT_EQ(record.result.total_count, 1u);
    EXPECT_FALSE(record.id.empty());
    EXPECT_EQ(stats.get("bob").hard, 1u);
}

TEST_F(JudgeServiceTest, FirstAcceptedCountedOnce) {
    const int SUBMISSIONS = 8;
    vector<thread> threads;
    for (int i = 0; i < SUBMISSIONS; ++i)
        threads.emplace_back([this] {
            submission_record record = service->submit_problem("alice", "echo", "python", "print(input())");
            EXPECT_EQ(record.result.verdict.kind, status::ACCEPTED);
        });
    for (auto &t : threads) t.join();

    local::solved_counters solved = stats.get("alice");
    EXPECT_EQ(solved.total, 1u);
    EXPECT_EQ(solved.medium, 1u);
    EXPECT_EQ(solved.easy, 0u);
    EXPECT_EQ(problems->counters("echo"), (pair<size_t, size_t>(SUBMISSIONS, SUBMISSIONS)));

    size_t records = distance(fs::directory_iterator(dir / "submissions"), fs::directory_iterator());
    EXPECT_EQ(records, (size_t)SUBMISSIONS);

    // 重新启动后仍然知道 alice 已经通过了这道题
    local::local_submission_store reloaded(dir / "submissions");
    EXPECT_FALSE(reloaded.mark_first_accepted("alice", "echo"));
    EXPECT_TRUE(reloaded.mark_first_accepted("carol", "echo"));
}

TEST_F(JudgeServiceTest, RejectedSubmissionIsNotSolved) {
    exec.on_execute = [](const string &, const string &, const cancellation_token *) {
        return execution_outcome(fake_executor::output("wrong"));
    };
    submission_record record = service->submit_problem("dave", "echo", "cpp", "");
    EXPECT_EQ(record.result.verdict.kind, status::WRONG_ANSWER);
    EXPECT_EQ(record.result.failed_case, 0u);
    EXPECT_EQ(stats.get("dave").total, 0u);
    EXPECT_EQ(problems->counters("echo"), (pair<size_t, size_t>(1, 0)));
}

TEST_F(JudgeServiceTest, SubmissionRecordJson) {
    submission_record record = service->submit_problem("erin", "echo", "python", "print(input())");
    nlohmann::json j = record;
    EXPECT_EQ(j["user_id"], "erin");
    EXPECT_EQ(j["problem_id"], "echo");
    EXPECT_EQ(j["result"]["verdict"]["status"], "Accepted");
}

TEST_F(JudgeServiceTest, UnboundedQueueWaitsForJobsAhead) {
    // 单个 worker 依次执行 4 个各需 0.1s 的任务，每个任务的截止时间为 0.3s
    config.workers = 1;
    config.queue_capacity = 0;
    config.time_limit = 0.1;
    config.job_overhead = 0.2;
    service.reset();
    jobs = make_unique<job_queue>(config.workers, config.queue_capacity);
    service = make_unique<judge_service>(config, *judge, *jobs, *problems, *submissions, stats);
    exec.on_execute = [](const string &, const string &stdin_text, const cancellation_token *) {
        this_thread::sleep_for(chrono::milliseconds(100));
        return execution_outcome(fake_executor::output(stdin_text));
    };

    const int REQUESTS = 4;
    atomic<int> answered{0};
    vector<thread> threads;
    for (int i = 0; i < REQUESTS; ++i) {
        threads.emplace_back([this, i, &answered] {
            try {
                EXPECT_EQ(service->run_once("python", "", to_string(i)).output, to_string(i));
                ++answered;
            } catch (overloaded_error &) {
                ADD_FAILURE() << "request " << i << " was accepted by the queue but reported as overloaded";
            }
        });
        // 保证按顺序入队
        this_thread::sleep_for(chrono::milliseconds(20));
    }
    for (auto &t : threads) t.join();

    EXPECT_EQ(answered, REQUESTS);
    EXPECT_EQ(jobs->stats().completed, (size_t)REQUESTS);
}

TEST_F(JudgeServiceTest, RunningJobOutlivesService) {
    config.request_timeout = 0.1;
    promise<void> release;
    shared_future<void> released = release.get_future().share();
    exec.on_execute = [released](const string &, const string &stdin_text, const cancellation_token *) {
        released.wait();
        return execution_outcome(fake_executor::output(stdin_text));
    };

    test_case tc;
    tc.input = "1";
    tc.expected_output = "1";
    EXPECT_THROW(service->submit("python", "", {tc, tc}), overloaded_error);

    // 调用者已经放弃等待，任务结束前 service 先被析构
    service.reset();
    release.set_value();
    jobs->stop();
    EXPECT_EQ(jobs->stats().completed, 1u);
    EXPECT_GE(exec.execute_calls, 1);
}
