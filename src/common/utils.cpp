#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace execjudge {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string trim(const string &text) {
    return boost::algorithm::trim_copy_if(text, boost::algorithm::is_space());
}

string replace_all(string text, const string &from, const string &to) {
    if (from.empty()) return text;
    boost::algorithm::replace_all(text, from, to);
    return text;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace execjudge
