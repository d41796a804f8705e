#include "judge/submission.hpp"

namespace execjudge {
using namespace std;
using json = nlohmann::json;

void to_json(json &j, const submission_result &result) {
    j = {{"verdict", result.verdict},
         {"passed_count", result.passed_count},
         {"total_count", result.total_count},
         {"runtime_ms", result.runtime_ms},
         {"max_runtime_ms", result.max_runtime_ms},
         {"memory_mb", result.memory_mb},
         {"memory_estimated", result.memory_estimated}};
    if (result.failed_case) {
        j["failed_case"] = *result.failed_case;
        j["failed_case_hidden"] = result.failed_case_hidden;
    }
}

void to_json(json &j, const run_result &result) {
    j = {{"status", get_display_message(result.result)},
         {"output", result.output}};
    if (result.runtime_ms) j["runtime_ms"] = *result.runtime_ms;
    if (result.memory_mb) j["memory_mb"] = *result.memory_mb;
    if (result.error_message) j["error_message"] = *result.error_message;
}

}  // namespace execjudge
