#include "test/environment.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <map>
#include <mutex>
#include "common/utils.hpp"
#include "language.hpp"

namespace execjudge::test {
using namespace std;
namespace fs = std::filesystem;

engine_config test_config(const fs::path &scratch_dir) {
    engine_config config = default_config();
#ifdef EXECJUDGE_RUNGUARD
    config.runguard = get_env("RUNGUARD", EXECJUDGE_RUNGUARD);
#else
    config.runguard = get_env("RUNGUARD", "runguard");
#endif
    config.scratch_dir = scratch_dir;
    config.workers = 2;
    config.queue_capacity = 16;
    return config;
}

fs::path unique_temp_dir(const string &prefix) {
    string name = prefix + "-" + boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = fs::temp_directory_path() / name;
    fs::create_directories(dir);
    return dir;
}

bool runguard_available(const engine_config &config) {
    return fs::is_regular_file(config.runguard);
}

static const map<string, string> hello_programs = {
    {"python", "print('ok')\n"},
    {"javascript", "console.log('ok');\n"},
    {"java", "public class Main { public static void main(String[] args) { System.out.println(\"ok\"); } }\n"},
    {"cpp", "#include <cstdio>\nint main() { puts(\"ok\"); }\n"}};

bool toolchain_available(executor &exec, const string &language) {
    static mutex mut;
    static map<string, bool> cache;
    scoped_lock guard(mut);
    if (auto it = cache.find(language); it != cache.end()) return it->second;

    execution_limits limits;
    limits.time_limit = 10;
    limits.memory_limit = 256;
    execution_outcome outcome = exec.run(resolve(language), hello_programs.at(language), "", limits);
    auto c = get_if<completed>(&outcome);
    bool available = c && c->exit_code == 0 && trim(c->stdout_text) == "ok";
    if (!available) LOG(WARNING) << "Toolchain of " << language << " is not usable in the sandbox";
    cache[language] = available;
    return available;
}

}  // namespace execjudge::test
