#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"
#include "sandbox/executor.hpp"

/**
 * 测试环境
 * 需要真实沙箱的测试通过 RUNGUARD 环境变量或者编译时的 runguard 路径找到 runguard。
 */
namespace execjudge::test {

/**
 * @brief 测试用的配置
 * @param scratch_dir 本测试独占的临时目录根目录
 */
engine_config test_config(const std::filesystem::path &scratch_dir);

/**
 * @brief 创建一个名字唯一的空目录，用作测试的临时目录根目录
 */
std::filesystem::path unique_temp_dir(const std::string &prefix);

/**
 * @brief runguard 是否存在
 */
bool runguard_available(const engine_config &config);

/**
 * @brief 语言的工具链在沙箱中是否可用
 * 通过在沙箱中运行一个输出 ok 的程序判断，结果按语言缓存。
 * 运行用户（比如 nobody）看不到的解释器也视为不可用。
 */
bool toolchain_available(executor &exec, const std::string &language);

}  // namespace execjudge::test
