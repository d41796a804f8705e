#include "sandbox/executor.hpp"

namespace execjudge {
using namespace std;

execution_outcome executor::run(const language_profile &profile, const string &source_code, const string &stdin_text, const execution_limits &limits, const cancellation_token *cancel) {
    prepare_result prepared = prepare(profile, source_code, cancel);
    if (auto outcome = get_if<execution_outcome>(&prepared))
        return *outcome;
    return execute(*get<unique_ptr<prepared_program>>(prepared), stdin_text, limits, cancel);
}

}  // namespace execjudge
