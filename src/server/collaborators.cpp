#include "server/collaborators.hpp"
#include <stdexcept>
#include "common/stl_utils.hpp"

namespace execjudge::server {
using namespace std;

difficulty parse_difficulty(const string &text) {
    string key = to_lower(text);
    if (key == "easy") return difficulty::EASY;
    if (key == "medium") return difficulty::MEDIUM;
    if (key == "hard") return difficulty::HARD;
    throw invalid_argument("Unrecognized difficulty " + text);
}

const char *difficulty_name(difficulty level) {
    switch (level) {
        case difficulty::EASY: return "Easy";
        case difficulty::MEDIUM: return "Medium";
        case difficulty::HARD: return "Hard";
    }
    return "Unknown";
}

void to_json(nlohmann::json &j, const submission_record &record) {
    j = {{"id", record.id},
         {"user_id", record.user_id},
         {"problem_id", record.problem_id},
         {"language", record.language},
         {"code", record.code},
         {"result", record.result},
         {"submitted_at", record.submitted_at}};
}

}  // namespace execjudge::server
