#include "sandbox/isolated_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/process.hpp"

namespace execjudge {
using namespace std;
namespace fs = std::filesystem;

// 超出 soft 时间限制后再等待多久才强制终止
static const double HARD_TIME_SLACK = 0.5;

// runguard 自身的启动和清理时间
static const double RUNGUARD_SLACK = 5;

// 托管堆运行时（JVM、V8）在堆之外的固定开销
static const int MANAGED_HEAP_OVERHEAD_MB = 128;

// 异常退出时峰值内存达到上限的这个比例，视为内存超限
static const double OOM_THRESHOLD = 0.9;

static const char *INTERNAL_FAILURE_MESSAGE = "Internal execution failure";

namespace {

struct sandbox_program : public prepared_program {
    sandbox_program(const language_profile &lang, scratch_directory &&dir)
        : lang(lang), dir(move(dir)) {}

    const language_profile &profile() const override {
        return lang;
    }

    const language_profile &lang;
    scratch_directory dir;
};

}  // namespace

/**
 * @brief 去掉输出中的主机路径，选手只能看到相对于工作目录的路径
 */
static string strip_host_paths(string text, const scratch_directory &dir) {
    text = replace_all(move(text), dir.box().string() + "/", "");
    text = replace_all(move(text), dir.box().string(), ".");
    text = replace_all(move(text), dir.path().string(), "");
    return text;
}

static bool contains_any(const string &text, const vector<string> &markers) {
    for (auto &marker : markers)
        if (text.find(marker) != string::npos) return true;
    return false;
}

static internal_failure sandbox_failure(const string &detail) {
    LOG(ERROR) << "Sandbox failure: " << detail;
    return internal_failure{INTERNAL_FAILURE_MESSAGE};
}

isolated_runner::isolated_runner(const engine_config &config) : config(config) {}

fs::path isolated_runner::sandbox_path(const fs::path &host_path) const {
    if (config.chroot_dir.empty()) return host_path;
    return "/" / fs::relative(host_path, config.chroot_dir);
}

runguard_result isolated_runner::invoke(const scratch_directory &dir, const string &phase, runguard_request request, const cancellation_token *cancel, bool &killed) {
    fs::path io = dir.io();
    request.work_dir = sandbox_path(dir.box());
    request.stdout_file = io / (phase + ".out");
    request.stderr_file = io / (phase + ".err");
    request.metafile = io / (phase + ".meta");

    auto args = runguard_arguments(config, request);
    process_result proc = exec_program(args, io / (phase + ".log"), request.metafile,
                                       request.wall_time_hard + RUNGUARD_SLACK, cancel);
    killed = proc.killed;

    runguard_result result = read_runguard_result(request.metafile);
    if (!killed && result.exitcode < 0) {
        // runguard 没能等到子进程结束，原因记录在 runguard 的日志里
        string log = read_file_content(io / (phase + ".log"), "");
        throw internal_execution_failure(fmt::format("runguard exited with {} without result: {}", proc.exitcode, trim(log)));
    }
    if (!result.internal_error.empty())
        throw internal_execution_failure("runguard: " + result.internal_error);
    if (result.isolation == "partial")
        LOG(WARNING) << "Namespaces are unavailable, " << phase << " runs with partial isolation";
    return result;
}

prepare_result isolated_runner::prepare(const language_profile &profile, const string &source_code, const cancellation_token *cancel) {
    try {
        auto program = make_unique<sandbox_program>(profile, scratch_directory(config.scratch_dir, config.debug));
        scratch_directory &dir = program->dir;
        write_file_content(dir.box() / assert_safe_path(profile.source_file), source_code);

        if (profile.needs_compile()) {
            runguard_request request;
            request.command = expand_command(profile, profile.compile_command, config.compile_memory_limit);
            request.wall_time_soft = request.wall_time_hard = config.compile_timeout;
            request.memory_limit = (int64_t)config.compile_memory_limit * 1024;

            bool killed;
            runguard_result result = invoke(dir, "compile", request, cancel, killed);
            if (killed) return execution_outcome(timed_out{max(0.0, result.wall_time * 1000)});
            if (!result.launch_error.empty())
                throw internal_execution_failure("compiler unavailable: " + result.launch_error);

            string log = read_file_content(dir.io() / "compile.out", "") + read_file_content(dir.io() / "compile.err", "");
            log = strip_host_paths(trim(log), dir);
            if (!result.time_result.empty())
                return execution_outcome(compile_failed{"Compilation time limit exceeded"});
            if (result.oom)
                return execution_outcome(compile_failed{"Compilation memory limit exceeded"});
            if (result.exitcode != 0)
                return execution_outcome(compile_failed{log.empty() ? "Compilation failed" : log});
            LOG(INFO) << "Compiled " << profile.name << " program in " << dir.path();
        }

        return prepare_result(unique_ptr<prepared_program>(move(program)));
    } catch (std::exception &ex) {
        return execution_outcome(sandbox_failure(ex.what()));
    }
}

execution_outcome isolated_runner::execute(prepared_program &program, const string &stdin_text, const execution_limits &limits, const cancellation_token *cancel) {
    try {
        auto *sandbox = dynamic_cast<sandbox_program *>(&program);
        if (!sandbox) throw internal_execution_failure("program was not prepared by isolated_runner");
        const language_profile &profile = sandbox->profile();
        scratch_directory &dir = sandbox->dir;

        double time_limit = limits.time_limit * profile.time_factor;
        int memory_mb = (int)ceil(limits.memory_limit * profile.memory_factor);
        int ceiling_mb = memory_mb + (profile.managed_heap ? MANAGED_HEAP_OVERHEAD_MB : 0);

        runguard_request request;
        request.command = expand_command(profile, profile.run_command, memory_mb);
        request.wall_time_soft = time_limit;
        request.wall_time_hard = time_limit + HARD_TIME_SLACK;
        request.cpu_time = time_limit;
        request.memory_limit = (int64_t)ceiling_mb * 1024;
        request.stdin_file = dir.io() / "stdin";
        write_file_content(request.stdin_file, stdin_text);

        bool killed;
        runguard_result result = invoke(dir, "run", request, cancel, killed);
        double elapsed_ms = max(0.0, result.wall_time * 1000);

        if (killed || !result.time_result.empty())
            return timed_out{elapsed_ms};

        if (!result.launch_error.empty())
            return launch_failed{strip_host_paths(result.launch_error, dir)};

        string stdout_text = read_file_content(dir.io() / "run.out", "");
        string stderr_text = strip_host_paths(read_file_content(dir.io() / "run.err", ""), dir);

        double peak_mb = result.memory >= 0 ? (double)result.memory / (1024 * 1024) : ceiling_mb;
        if (result.oom)
            return memory_exceeded{peak_mb};
        if (result.exitcode != 0) {
            bool near_ceiling = result.memory >= 0 && result.memory >= OOM_THRESHOLD * ceiling_mb * 1024 * 1024;
            if (near_ceiling || contains_any(stderr_text, profile.oom_markers))
                return memory_exceeded{peak_mb};
        }

        completed outcome;
        outcome.exit_code = result.exitcode;
        outcome.stdout_text = move(stdout_text);
        outcome.stderr_text = move(stderr_text);
        outcome.elapsed_ms = elapsed_ms;
        outcome.peak_memory_mb = peak_mb;
        outcome.memory_estimated = result.memory < 0;
        return outcome;
    } catch (std::exception &ex) {
        return sandbox_failure(ex.what());
    }
}

}  // namespace execjudge
