#include "judge/verdict.hpp"
#include "common/utils.hpp"

namespace execjudge {
using namespace std;

comparison compare(const string &expected, const string &actual) {
    return trim(expected) == trim(actual) ? comparison::MATCH : comparison::MISMATCH;
}

static verdict make_verdict(status kind, const string &message) {
    verdict v;
    v.kind = kind;
    v.message = message;
    return v;
}

verdict verdict::accepted() {
    return make_verdict(status::ACCEPTED, "");
}

verdict verdict::wrong_answer(const string &expected, const string &actual) {
    verdict v = make_verdict(status::WRONG_ANSWER, "Expected: " + trim(expected) + "\nActual: " + trim(actual));
    v.expected = trim(expected);
    v.actual = trim(actual);
    return v;
}

verdict verdict::time_limit_exceeded() {
    return make_verdict(status::TIME_LIMIT_EXCEEDED, "Time limit exceeded");
}

verdict verdict::memory_limit_exceeded() {
    return make_verdict(status::MEMORY_LIMIT_EXCEEDED, "Memory limit exceeded");
}

verdict verdict::runtime_error(const string &message) {
    return make_verdict(status::RUNTIME_ERROR, message);
}

verdict verdict::compile_error(const string &message) {
    return make_verdict(status::COMPILATION_ERROR, message);
}

verdict verdict::system_error(const string &message) {
    return make_verdict(status::SYSTEM_ERROR, message);
}

void to_json(nlohmann::json &j, const verdict &v) {
    j = {{"status", get_display_message(v.kind)}};
    if (!v.message.empty()) j["message"] = v.message;
    if (v.kind == status::WRONG_ANSWER) {
        j["expected"] = v.expected;
        j["actual"] = v.actual;
    }
}

}  // namespace execjudge
