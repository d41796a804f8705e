#pragma once

#include <string>
#include <vector>

/**
 * 语言注册表
 * 每种支持的语言都有一个静态的 language_profile，描述如何编译、运行选手代码。
 * 所有语言都实现同一个 {编译（可选），运行} 的约定，由 isolated_runner 统一执行，
 * 不存在针对某种语言的特殊分支。
 */
namespace execjudge {

enum class language {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    CPP
};

struct language_profile {
    language id;

    /**
     * @brief 语言标识符，如 "python"
     */
    std::string name;

    /**
     * @brief 源代码保存的文件名，如 "main.py"、"Main.java"
     */
    std::string source_file;

    /**
     * @brief 编译产物的文件名，对于解释型语言为空
     */
    std::string executable;

    /**
     * @brief 编译命令模板，为空表示解释型语言，不需要编译
     * 模板中可以使用以下占位符：
     * {source}: 源代码文件名
     * {executable}: 编译产物文件名
     * {memory}: 内存限制（MB）
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令模板，占位符同 compile_command
     */
    std::vector<std::string> run_command;

    /**
     * @brief 时间限制倍数，沙箱实际使用的时间限制为 time_limit * time_factor
     */
    double time_factor = 1;

    /**
     * @brief 内存限制倍数，解释型语言和 JVM 需要更大的基础内存
     */
    double memory_factor = 1;

    /**
     * @brief 运行时在 stderr 中报告内存耗尽的标志
     * 在没有 cgroup 的环境下，内存超限不会被内核直接识别，程序通常是分配失败后自行退出。
     * 这时如果 stderr 中出现这些字符串，我们认为是内存超限。
     */
    std::vector<std::string> oom_markers;

    /**
     * @brief 运行时是否通过 {memory} 参数自行管理堆大小（JVM、V8）
     * 这类运行时除了堆以外还有固定的运行时开销，沙箱的内存上限需要在堆大小之上留出余量，
     * 否则堆还没用满进程就会被 cgroup 杀死，无法给出 OutOfMemoryError。
     */
    bool managed_heap = false;

    bool needs_compile() const;
};

/**
 * @brief 根据语言标识符（不区分大小写）查找语言
 * @throw unsupported_language 如果不是支持的语言
 */
language parse_language(const std::string &name);

const char *language_name(language lang);

/**
 * @brief 获得语言对应的 language_profile
 * 所有 profile 在第一次调用时构造，之后不会修改，可以并发调用
 */
const language_profile &resolve(language lang);

/**
 * @brief 根据语言标识符获得 language_profile
 * @throw unsupported_language 如果不是支持的语言
 */
const language_profile &resolve(const std::string &name);

/**
 * @brief 展开命令模板中的占位符
 * @param command 命令模板，来自 compile_command 或 run_command
 * @param memory_mb 替换 {memory} 的内存限制
 */
std::vector<std::string> expand_command(const language_profile &profile, const std::vector<std::string> &command, int memory_mb);

}  // namespace execjudge
