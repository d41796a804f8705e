#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace execjudge {
using namespace std;

execjudge_exception::execjudge_exception()
    : execjudge_exception("") {}

execjudge_exception::execjudge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *execjudge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const execjudge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unsupported_language::unsupported_language(const string &language)
    : execjudge_exception("Unsupported language " + language), language(language) {}

internal_execution_failure::internal_execution_failure()
    : execjudge_exception() {}

internal_execution_failure::internal_execution_failure(const string &message)
    : execjudge_exception(message) {}

overloaded_error::overloaded_error()
    : execjudge_exception("Execution queue is full, retry later") {}

overloaded_error::overloaded_error(const string &message)
    : execjudge_exception(message) {}

not_found_error::not_found_error(const string &message)
    : execjudge_exception(message) {}

}  // namespace execjudge
