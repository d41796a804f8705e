#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace execjudge {

struct execjudge_exception : std::exception {
    execjudge_exception();
    explicit execjudge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const execjudge_exception &ex);

    template <typename T>
    execjudge_exception operator<<(const T &t) const {
        return execjudge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 调用者请求了语言注册表之外的语言
 * 在分配任何沙箱资源之前抛出
 */
struct unsupported_language : public execjudge_exception {
    explicit unsupported_language(const std::string &language);

    const std::string language;
};

/**
 * @brief 表示沙箱内部错误
 * 比如临时目录无法创建、runguard 无法启动，与选手代码无关。
 * 这个异常不会越过 isolated_runner，会被转换为 internal_failure。
 */
struct internal_execution_failure : public execjudge_exception {
    internal_execution_failure();
    explicit internal_execution_failure(const std::string &message);
};

/**
 * @brief 评测队列已满，调用者应稍后重试
 */
struct overloaded_error : public execjudge_exception {
    overloaded_error();
    explicit overloaded_error(const std::string &message);
};

/**
 * @brief 外部协作者找不到请求的对象（比如题目）
 */
struct not_found_error : public execjudge_exception {
    explicit not_found_error(const std::string &message);
};

}  // namespace execjudge
