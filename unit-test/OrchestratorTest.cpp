#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/orchestrator.hpp"
#include "test/fake_executor.hpp"

using namespace std;
using namespace execjudge;
using execjudge::test::fake_executor;

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() : config(default_config()), judge(exec, config) {}

    static vector<test_case> cases(initializer_list<pair<string, string>> list) {
        vector<test_case> result;
        for (auto &[input, output] : list) {
            test_case tc;
            tc.input = input;
            tc.expected_output = output;
            result.push_back(tc);
        }
        return result;
    }

    engine_config config;
    fake_executor exec;
    orchestrator judge;
};

TEST_F(OrchestratorTest, AllCasesPass) {
    // 输出为输入的两倍，运行时间由输入决定
    exec.on_execute = [](const string &, const string &stdin_text, const cancellation_token *) {
        int n = stoi(stdin_text);
        return execution_outcome(fake_executor::output(to_string(n * 2) + "\n", n * 10));
    };
    submission_result result = judge.evaluate("cpp", "int main() {}", cases({{"1", "2"}, {"2", "4"}, {"3", "6"}}));
    EXPECT_EQ(result.verdict.kind, status::ACCEPTED);
    EXPECT_EQ(result.passed_count, 3u);
    EXPECT_EQ(result.total_count, 3u);
    EXPECT_DOUBLE_EQ(result.runtime_ms, 20);
    EXPECT_DOUBLE_EQ(result.max_runtime_ms, 30);
    EXPECT_EQ(result.verdict.message, "All test cases passed!\nAverage Runtime: 20.00ms");
    EXPECT_FALSE(result.failed_case);
    // 编译只进行一次
    EXPECT_EQ(exec.prepare_calls, 1);
    EXPECT_EQ(exec.execute_calls, 3);
}

TEST_F(OrchestratorTest, StopsAtFirstFailure) {
    submission_result result = judge.evaluate("python", "print(input())", cases({{"1", "1"}, {"2", "3"}, {"4", "4"}, {"5", "5"}}));
    EXPECT_EQ(result.verdict.kind, status::WRONG_ANSWER);
    EXPECT_EQ(result.verdict.message, "Expected: 3\nActual: 2");
    EXPECT_EQ(result.passed_count, 1u);
    EXPECT_EQ(result.total_count, 4u);
    EXPECT_EQ(result.failed_case, 1u);
    EXPECT_EQ(exec.execute_calls, 2);
}

TEST_F(OrchestratorTest, HiddenCaseFailure) {
    auto list = cases({{"1", "1"}, {"2", "two"}});
    list[1].hidden = true;
    submission_result result = judge.evaluate("python", "print(input())", list);
    EXPECT_EQ(result.failed_case, 1u);
    EXPECT_TRUE(result.failed_case_hidden);
    // 失败的隐藏测试点仍然给出标准输出和选手输出
    EXPECT_EQ(result.verdict.expected, "two");
    EXPECT_EQ(result.verdict.actual, "2");
}

TEST_F(OrchestratorTest, CompileErrorRunsNothing) {
    exec.prepare_failure = compile_failed{"main.cpp:1:1: error: expected unqualified-id"};
    submission_result result = judge.evaluate("cpp", "int main(", cases({{"1", "1"}}));
    EXPECT_EQ(result.verdict.kind, status::COMPILATION_ERROR);
    EXPECT_EQ(result.verdict.message, "main.cpp:1:1: error: expected unqualified-id");
    EXPECT_EQ(result.passed_count, 0u);
    EXPECT_EQ(result.total_count, 1u);
    EXPECT_FALSE(result.failed_case);
    EXPECT_EQ(exec.execute_calls, 0);
}

TEST_F(OrchestratorTest, OutcomeClassification) {
    struct expectation {
        execution_outcome outcome;
        status kind;
    };
    vector<expectation> table = {
        {timed_out{5000}, status::TIME_LIMIT_EXCEEDED},
        {memory_exceeded{128}, status::MEMORY_LIMIT_EXCEEDED},
        {launch_failed{"exec failed"}, status::RUNTIME_ERROR},
        {internal_failure{"Internal execution failure"}, status::SYSTEM_ERROR},
        {fake_executor::output("", 1, 1, "Traceback\nZeroDivisionError: division by zero\n"), status::RUNTIME_ERROR}};

    for (auto &e : table) {
        fake_executor local;
        orchestrator j(local, config);
        local.on_execute = [&](const string &, const string &, const cancellation_token *) { return e.outcome; };
        submission_result result = j.evaluate("python", "", cases({{"", ""}, {"", ""}}));
        EXPECT_EQ(result.verdict.kind, e.kind);
        EXPECT_EQ(result.passed_count, 0u);
        EXPECT_EQ(result.failed_case, 0u);
    }
}

TEST_F(OrchestratorTest, RuntimeErrorMessage) {
    exec.on_execute = [](const string &, const string &, const cancellation_token *) {
        return execution_outcome(fake_executor::output("", 1, 1, "ZeroDivisionError: division by zero\n"));
    };
    EXPECT_EQ(judge.evaluate("python", "", cases({{"", ""}})).verdict.message, "ZeroDivisionError: division by zero");

    exec.on_execute = [](const string &, const string &, const cancellation_token *) {
        return execution_outcome(fake_executor::output("", 1, 128 + 11));
    };
    EXPECT_EQ(judge.evaluate("cpp", "", cases({{"", ""}})).verdict.message, "Process terminated by signal 11");

    exec.on_execute = [](const string &, const string &, const cancellation_token *) {
        return execution_outcome(fake_executor::output("", 1, 3));
    };
    EXPECT_EQ(judge.evaluate("cpp", "", cases({{"", ""}})).verdict.message, "Process exited with code 3");
}

TEST_F(OrchestratorTest, EmptyCaseList) {
    submission_result result = judge.evaluate("java", "class Main {}", {});
    EXPECT_EQ(result.verdict.kind, status::ACCEPTED);
    EXPECT_EQ(result.passed_count, 0u);
    EXPECT_EQ(result.total_count, 0u);
    EXPECT_EQ(exec.prepare_calls, 0);
}

TEST_F(OrchestratorTest, UnsupportedLanguageBeforeSandbox) {
    EXPECT_THROW(judge.evaluate("ruby", "puts 1", cases({{"", "1"}})), unsupported_language);
    EXPECT_THROW(judge.run_once("ruby", "puts 1", ""), unsupported_language);
    EXPECT_EQ(exec.prepare_calls, 0);
}

TEST_F(OrchestratorTest, CancelledJobIsTimeLimitExceeded) {
    cancellation_token token;
    // 第一个测试点运行期间任务超出总截止时间
    exec.on_execute = [&](const string &, const string &stdin_text, const cancellation_token *) {
        token.cancel();
        return execution_outcome(fake_executor::output(stdin_text));
    };
    submission_result result = judge.evaluate("python", "", cases({{"1", "1"}, {"2", "2"}, {"3", "3"}}),
                                               judge.default_limits(), &token);
    EXPECT_EQ(result.verdict.kind, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.passed_count, 1u);
    EXPECT_EQ(result.failed_case, 1u);
    EXPECT_EQ(exec.execute_calls, 1);
}

TEST_F(OrchestratorTest, MemoryIsPeakOverCases) {
    exec.on_execute = [](const string &, const string &stdin_text, const cancellation_token *) {
        completed c = fake_executor::output(stdin_text);
        c.peak_memory_mb = stod(stdin_text);
        return execution_outcome(c);
    };
    submission_result result = judge.evaluate("python", "", cases({{"12", "12"}, {"40", "40"}, {"8", "8"}}));
    EXPECT_DOUBLE_EQ(result.memory_mb, 40);
    EXPECT_FALSE(result.memory_estimated);
}

TEST_F(OrchestratorTest, RunOnce) {
    run_result result = judge.run_once("python", "print(input())", "hello\n");
    EXPECT_EQ(result.result, status::ACCEPTED);
    EXPECT_EQ(result.output, "hello");
    EXPECT_TRUE(result.runtime_ms);
    EXPECT_FALSE(result.error_message);

    exec.on_execute = [](const string &, const string &, const cancellation_token *) {
        return execution_outcome(fake_executor::output("partial", 1, 1, "ValueError: bad input"));
    };
    result = judge.run_once("python", "", "");
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    EXPECT_EQ(result.output, "partial");
    EXPECT_EQ(result.error_message, "ValueError: bad input");

    exec.prepare_failure = compile_failed{"error: expected ';'"};
    result = judge.run_once("cpp", "", "");
    EXPECT_EQ(result.result, status::COMPILATION_ERROR);
    EXPECT_EQ(result.error_message, "error: expected ';'");
    EXPECT_FALSE(result.runtime_ms);
}
