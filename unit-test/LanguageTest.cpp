#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "language.hpp"

using namespace std;
using namespace execjudge;

TEST(LanguageTest, ResolvesAllLanguages) {
    EXPECT_EQ(resolve("python").id, language::PYTHON);
    EXPECT_EQ(resolve("javascript").id, language::JAVASCRIPT);
    EXPECT_EQ(resolve("java").id, language::JAVA);
    EXPECT_EQ(resolve("cpp").id, language::CPP);

    EXPECT_FALSE(resolve("python").needs_compile());
    EXPECT_FALSE(resolve("javascript").needs_compile());
    EXPECT_TRUE(resolve("java").needs_compile());
    EXPECT_TRUE(resolve("cpp").needs_compile());
}

TEST(LanguageTest, NamesAreCaseInsensitive) {
    EXPECT_EQ(parse_language("PyThOn"), language::PYTHON);
    EXPECT_EQ(parse_language("CPP"), language::CPP);
    EXPECT_STREQ(language_name(language::JAVA), "java");
}

TEST(LanguageTest, UnsupportedLanguage) {
    EXPECT_THROW(resolve("ruby"), unsupported_language);
    EXPECT_THROW(parse_language(""), unsupported_language);
    try {
        resolve("c++");
        FAIL() << "c++ is not a language identifier";
    } catch (unsupported_language &ex) {
        EXPECT_EQ(ex.language, "c++");
    }
}

TEST(LanguageTest, ExpandCommand) {
    const language_profile &java = resolve("java");
    vector<string> run = expand_command(java, java.run_command, 256);
    EXPECT_EQ(run.front(), "java");
    EXPECT_EQ(run[1], "-Xmx256m");
    EXPECT_EQ(run.back(), "Main");

    const language_profile &cpp = resolve("cpp");
    vector<string> compile = expand_command(cpp, cpp.compile_command, 128);
    EXPECT_EQ(compile.back(), "main.cpp");
    EXPECT_EQ(expand_command(cpp, cpp.run_command, 128), vector<string>{"./main"});

    const language_profile &js = resolve("javascript");
    EXPECT_EQ(expand_command(js, js.run_command, 64)[1], "--max-old-space-size=64");
}

TEST(LanguageTest, ResourceFactors) {
    for (auto name : {"python", "javascript", "java", "cpp"}) {
        const language_profile &p = resolve(name);
        EXPECT_GE(p.time_factor, 1) << name;
        EXPECT_GE(p.memory_factor, 1) << name;
        EXPECT_FALSE(p.oom_markers.empty()) << name;
    }
    EXPECT_TRUE(resolve("java").managed_heap);
    EXPECT_FALSE(resolve("cpp").managed_heap);
}
