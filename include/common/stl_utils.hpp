#pragma once

#include <string>

namespace execjudge {

/**
 * @brief 将字符串转为小写，用于不区分大小写的标识符比较
 */
std::string to_lower(std::string s);

/**
 * @brief std::visit 的多 lambda 访问者
 * @code{.cpp}
 *     std::visit(overloaded{
 *         [](const completed &c) { ... },
 *         [](const timed_out &) { ... }}, outcome);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace execjudge
