#include <nlohmann/json.hpp>
#include "gtest/gtest.h"
#include "judge/verdict.hpp"

using namespace std;
using namespace execjudge;

TEST(VerdictTest, TrimsOnlyLeadingAndTrailingWhitespace) {
    EXPECT_EQ(compare(" 5\n", "5"), comparison::MATCH);
    EXPECT_EQ(compare("[0,1]", "[0,1]\n\n"), comparison::MATCH);
    EXPECT_EQ(compare("\t1 2\r\n", "1 2"), comparison::MATCH);

    // 中间的空白字符必须完全一致
    EXPECT_EQ(compare("5 6", "56"), comparison::MISMATCH);
    EXPECT_EQ(compare("1\n2", "1 2"), comparison::MISMATCH);
    // 不做数值比较，也不忽略大小写
    EXPECT_EQ(compare("1.0", "1"), comparison::MISMATCH);
    EXPECT_EQ(compare("Yes", "YES"), comparison::MISMATCH);
}

TEST(VerdictTest, EmptyOutputs) {
    EXPECT_EQ(compare("", "\n"), comparison::MATCH);
    EXPECT_EQ(compare("0", ""), comparison::MISMATCH);
}

TEST(VerdictTest, WrongAnswerMessage) {
    verdict v = verdict::wrong_answer("[0,1]\n", " [1,0] ");
    EXPECT_EQ(v.kind, status::WRONG_ANSWER);
    EXPECT_EQ(v.message, "Expected: [0,1]\nActual: [1,0]");
    EXPECT_EQ(v.expected, "[0,1]");
    EXPECT_EQ(v.actual, "[1,0]");
}

TEST(VerdictTest, DisplayNames) {
    EXPECT_STREQ(get_display_message(status::ACCEPTED), "Accepted");
    EXPECT_STREQ(get_display_message(status::COMPILATION_ERROR), "Compile Error");
    EXPECT_STREQ(get_display_message(status::TIME_LIMIT_EXCEEDED), "Time Limit Exceeded");
    EXPECT_EQ(verdict::time_limit_exceeded().message, "Time limit exceeded");
}

TEST(VerdictTest, ToJson) {
    nlohmann::json j = verdict::wrong_answer("3", "4");
    EXPECT_EQ(j["status"], "Wrong Answer");
    EXPECT_EQ(j["expected"], "3");
    EXPECT_EQ(j["actual"], "4");

    j = verdict::accepted();
    EXPECT_EQ(j["status"], "Accepted");
    EXPECT_FALSE(j.contains("expected"));
}
