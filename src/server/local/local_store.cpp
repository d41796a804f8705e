#include "server/local/local_store.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace execjudge::server::local {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

local_problem_repository::local_problem_repository(const fs::path &problem_dir)
    : problem_dir(problem_dir) {}

problem parse_problem(const string &id, const json &j) {
    problem prob;
    prob.id = id;
    prob.title = get_value_def<string>(j, id, "title");
    prob.level = parse_difficulty(get_value_def<string>(j, "Easy", "difficulty"));

    if (exists(j, "examples")) {
        for (auto &e : access(j, "examples")) {
            example ex;
            ex.input = get_value<string>(e, "input");
            ex.output = get_value<string>(e, "output");
            prob.examples.push_back(ex);
        }
    }

    if (exists(j, "test_cases")) {
        for (auto &t : access(j, "test_cases")) {
            test_case tc;
            tc.input = get_value<string>(t, "input");
            tc.expected_output = get_value<string>(t, "expected_output");
            tc.hidden = get_value_def<bool>(t, false, "is_hidden");
            prob.test_cases.push_back(tc);
        }
    }
    return prob;
}

problem local_problem_repository::find_problem(const string &id) {
    fs::path file;
    try {
        file = problem_dir / (assert_safe_path(id) + ".json");
    } catch (runtime_error &) {
        throw not_found_error("Problem " + id + " not found");
    }
    if (!fs::is_regular_file(file))
        throw not_found_error("Problem " + id + " not found");

    try {
        return parse_problem(id, json::parse(read_file_content(file)));
    } catch (json::exception &ex) {
        throw invalid_argument("Problem " + id + " is malformed: " + ex.what());
    }
}

void local_problem_repository::record_submission(const string &id, bool accepted) {
    scoped_lock guard(mut);
    auto &counter = submission_counters[id];
    ++counter.first;
    if (accepted) ++counter.second;
}

pair<size_t, size_t> local_problem_repository::counters(const string &id) {
    scoped_lock guard(mut);
    auto it = submission_counters.find(id);
    return it == submission_counters.end() ? pair<size_t, size_t>(0, 0) : it->second;
}

local_submission_store::local_submission_store(const fs::path &submission_dir)
    : submission_dir(submission_dir) {
    fs::create_directories(submission_dir);

    for (auto &entry : fs::directory_iterator(submission_dir)) {
        if (entry.path().extension() != ".json") continue;
        try {
            json j = json::parse(read_file_content(entry.path()));
            if (get_value<string>(j, "result", "verdict", "status") == get_display_message(status::ACCEPTED))
                first_accepted.insert({get_value<string>(j, "user_id"), get_value<string>(j, "problem_id")});
        } catch (std::exception &ex) {
            LOG(WARNING) << "Skipping malformed submission record " << entry.path() << ": " << ex.what();
        }
    }
}

string local_submission_store::save(const submission_record &record) {
    string id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    submission_record stored = record;
    stored.id = id;
    json j = stored;
    write_file_content(submission_dir / (id + ".json"), j.dump(2));
    return id;
}

bool local_submission_store::mark_first_accepted(const string &user_id, const string &problem_id) {
    scoped_lock guard(mut);
    return first_accepted.insert({user_id, problem_id}).second;
}

void memory_user_statistics::record_solved(const string &user_id, difficulty level) {
    scoped_lock guard(mut);
    solved_counters &counter = users[user_id];
    ++counter.total;
    switch (level) {
        case difficulty::EASY: ++counter.easy; break;
        case difficulty::MEDIUM: ++counter.medium; break;
        case difficulty::HARD: ++counter.hard; break;
    }
}

solved_counters memory_user_statistics::get(const string &user_id) {
    scoped_lock guard(mut);
    auto it = users.find(user_id);
    return it == users.end() ? solved_counters() : it->second;
}

}  // namespace execjudge::server::local
