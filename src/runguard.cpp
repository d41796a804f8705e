#include "runguard.hpp"
#include <unistd.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include "common/utils.hpp"

namespace execjudge {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // "key:" 表示值为空
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // ignore exception
    }
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "child-pid", result.child_pid);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "memory-source", result.memory_source);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "internal-error", result.internal_error);
    try_to_parse(metadata, "launch-error", result.launch_error);
    try_to_parse(metadata, "isolation", result.isolation);
    try_to_parse(metadata, "output-truncated", result.output_truncated);
    if (metadata.count("memory-result")) result.oom = metadata.at("memory-result") == "oom";
    if (metadata.count("cgroup-paths") && !metadata.at("cgroup-paths").empty())
        boost::split(result.cgroup_paths, metadata.at("cgroup-paths"), boost::is_any_of(","));
    return result;
}

vector<string> runguard_arguments(const engine_config &config, const runguard_request &request) {
    vector<string> args;
    to_string_list(args, config.runguard);

    string run_user = config.run_user;
    // runguard 拒绝以 root 运行选手程序
    if (run_user.empty() && geteuid() == 0) run_user = "nobody";
    if (!run_user.empty()) {
        to_string_list(args, "--user", run_user);
        if (!config.run_group.empty()) to_string_list(args, "--group", config.run_group);

        // RLIMIT_NPROC 按用户统计，只有独立的运行用户才能可靠地限制
        int nproc = config.process_limit > 0 ? config.process_limit : 64;
        to_string_list(args, "--nproc", nproc);
    } else if (config.process_limit > 0) {
        to_string_list(args, "--nproc", config.process_limit);
    }

    if (!config.chroot_dir.empty()) to_string_list(args, "--root", config.chroot_dir);

    to_string_list(args,
                   "--work-dir", request.work_dir,
                   "--wall-time", fmt::format("{:.3f}:{:.3f}", request.wall_time_soft, request.wall_time_hard));
    if (request.cpu_time > 0)
        to_string_list(args, "--cpu-time", fmt::format("{:.3f}", request.cpu_time));
    if (request.memory_limit > 0)
        to_string_list(args, "--memory-limit", request.memory_limit);

    to_string_list(args,
                   "--file-limit", config.output_limit,
                   "--stream-size", config.output_limit,
                   "--no-core-dumps",
                   "--no-network");
    if (config.require_isolation) to_string_list(args, "--require-isolation");

    if (!request.stdin_file.empty()) to_string_list(args, "--standard-input-file", request.stdin_file);
    to_string_list(args,
                   "--standard-output-file", request.stdout_file,
                   "--standard-error-file", request.stderr_file,
                   "--out-meta", request.metafile,
                   "--", request.command);
    return args;
}

}  // namespace execjudge
