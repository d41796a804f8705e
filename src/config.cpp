#include "config.hpp"
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace execjudge {
using namespace std;
using json = nlohmann::json;

engine_config default_config() {
    engine_config config;
    config.workers = max(1u, thread::hardware_concurrency());
    config.scratch_dir = filesystem::path(get_env("TMPDIR", "/tmp")) / "execjudge";
    return config;
}

template <typename T>
static void assign_if(const json &j, const char *key, T &value) {
    if (j.count(key)) j.at(key).get_to(value);
}

static void assign_path_if(const json &j, const char *key, filesystem::path &value) {
    if (j.count(key)) value = j.at(key).get<string>();
}

void load_config_file(engine_config &config, const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw runtime_error("Configuration file " + path.string() + " does not exist");

    json j;
    try {
        j = json::parse(read_file_content(path));
        assign_if(j, "time_limit", config.time_limit);
        assign_if(j, "memory_limit", config.memory_limit);
        assign_if(j, "workers", config.workers);
        assign_if(j, "queue_capacity", config.queue_capacity);
        assign_if(j, "compile_timeout", config.compile_timeout);
        assign_if(j, "compile_memory_limit", config.compile_memory_limit);
        assign_if(j, "output_limit", config.output_limit);
        assign_if(j, "process_limit", config.process_limit);
        assign_if(j, "job_overhead", config.job_overhead);
        assign_if(j, "request_timeout", config.request_timeout);
        assign_path_if(j, "scratch_dir", config.scratch_dir);
        assign_path_if(j, "runguard", config.runguard);
        assign_path_if(j, "chroot_dir", config.chroot_dir);
        assign_if(j, "run_user", config.run_user);
        assign_if(j, "run_group", config.run_group);
        assign_if(j, "require_isolation", config.require_isolation);
        assign_if(j, "debug", config.debug);
    } catch (json::exception &ex) {
        throw runtime_error("Configuration file " + path.string() + " is malformed: " + ex.what());
    }
}

template <typename T>
static void assign_env(const char *key, T &value) {
    const char *text = getenv(key);
    if (!text) return;
    try {
        value = boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument(string("Environment variable ") + key + " is malformed: " + text);
    }
}

void load_config_env(engine_config &config) {
    assign_env("EXECJUDGE_TIME_LIMIT", config.time_limit);
    assign_env("EXECJUDGE_MEMORY_LIMIT", config.memory_limit);
    assign_env("EXECJUDGE_WORKERS", config.workers);
    assign_env("EXECJUDGE_QUEUE_CAPACITY", config.queue_capacity);
    assign_env("EXECJUDGE_COMPILE_TIMEOUT", config.compile_timeout);
    if (getenv("EXECJUDGE_SCRATCH_DIR")) config.scratch_dir = getenv("EXECJUDGE_SCRATCH_DIR");
    if (getenv("RUNGUARD")) config.runguard = getenv("RUNGUARD");
    if (getenv("CHROOTDIR")) config.chroot_dir = getenv("CHROOTDIR");
    if (getenv("RUNUSER")) config.run_user = getenv("RUNUSER");
    if (getenv("RUNGROUP")) config.run_group = getenv("RUNGROUP");
    if (getenv("DEBUG")) config.debug = true;
}

void validate_config(const engine_config &config) {
    if (config.time_limit <= 0) throw invalid_argument("time limit must be positive");
    if (config.memory_limit <= 0) throw invalid_argument("memory limit must be positive");
    if (config.workers == 0) throw invalid_argument("worker pool size must be positive");
    if (config.compile_timeout <= 0) throw invalid_argument("compile timeout must be positive");
    if (config.compile_memory_limit <= 0) throw invalid_argument("compile memory limit must be positive");
    if (config.output_limit <= 0) throw invalid_argument("output limit must be positive");
    if (config.process_limit < 0) throw invalid_argument("process limit must not be negative");
    if (config.job_overhead < 0) throw invalid_argument("job overhead must not be negative");
    if (config.request_timeout < 0) throw invalid_argument("request timeout must not be negative");
    if (config.scratch_dir.empty()) throw invalid_argument("scratch directory is not set");
    if (config.runguard.empty()) throw invalid_argument("runguard path is not set, pass --runguard or RUNGUARD");
    if (!config.chroot_dir.empty() && !filesystem::is_directory(config.chroot_dir))
        throw invalid_argument("chroot directory " + config.chroot_dir.string() + " does not exist");
}

}  // namespace execjudge
