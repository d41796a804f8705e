#include "common/stl_utils.hpp"
#include <algorithm>
#include <cctype>

namespace execjudge {
using namespace std;

string to_lower(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)::tolower(c); });
    return s;
}

}  // namespace execjudge
