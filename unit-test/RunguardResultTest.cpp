#include <algorithm>
#include <filesystem>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "runguard.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace execjudge;
namespace fs = std::filesystem;

class RunguardResultTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        dir = test::unique_temp_dir("execjudge-meta");
    }

    static void TearDownTestCase() {
        fs::remove_all(dir);
    }

    static fs::path dir;
};

fs::path RunguardResultTest::dir;

TEST_F(RunguardResultTest, ParsesMetaFile) {
    fs::path meta = dir / "run.meta";
    write_file_content(meta,
                       "isolation: partial\n"
                       "child-pid: 4242\n"
                       "wall-time: 1.250\n"
                       "user-time: 0.900\n"
                       "sys-time: 0.100\n"
                       "cpu-time: 1.000\n"
                       "memory-bytes: 10485760\n"
                       "memory-source: cgroup\n"
                       "memory-result: oom\n"
                       "exitcode: 137\n"
                       "signal: 9\n"
                       "time-result: \n"
                       "output-truncated: stdout\n");
    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.isolation, "partial");
    EXPECT_EQ(result.child_pid, 4242);
    EXPECT_DOUBLE_EQ(result.wall_time, 1.25);
    EXPECT_DOUBLE_EQ(result.cpu_time, 1);
    EXPECT_EQ(result.memory, 10485760);
    EXPECT_EQ(result.memory_source, "cgroup");
    EXPECT_TRUE(result.oom);
    EXPECT_EQ(result.exitcode, 137);
    EXPECT_EQ(result.signal, 9);
    EXPECT_TRUE(result.time_result.empty());
    EXPECT_EQ(result.output_truncated, "stdout");
    EXPECT_TRUE(result.launch_error.empty());
}

TEST_F(RunguardResultTest, MissingKeysKeepDefaults) {
    fs::path meta = dir / "empty.meta";
    write_file_content(meta, "memory-result:\nlaunch-error: No such file or directory\n");
    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.exitcode, -1);
    EXPECT_EQ(result.memory, -1);
    EXPECT_FALSE(result.oom);
    EXPECT_EQ(result.launch_error, "No such file or directory");

    // meta 文件不存在时所有键都缺失
    EXPECT_EQ(read_runguard_result(dir / "none.meta").exitcode, -1);
}

TEST_F(RunguardResultTest, CgroupPathsAndLateIsolationWarning) {
    fs::path meta = dir / "cgroup.meta";
    write_file_content(meta,
                       "cgroup-paths: /sys/fs/cgroup/memory/execjudge/box_1_2,/sys/fs/cgroup/cpuacct/execjudge/box_1_2\n"
                       "isolation: full\n"
                       "child-pid: 77\n"
                       "isolation: partial\n");
    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.cgroup_paths, (vector<string>{"/sys/fs/cgroup/memory/execjudge/box_1_2",
                                                   "/sys/fs/cgroup/cpuacct/execjudge/box_1_2"}));
    // 子进程没能限制文件系统时，runguard 在之后追加 "isolation: partial"
    EXPECT_EQ(result.isolation, "partial");

    EXPECT_TRUE(read_runguard_result(dir / "none.meta").cgroup_paths.empty());
}

TEST_F(RunguardResultTest, Arguments) {
    engine_config config = default_config();
    config.runguard = "/opt/runguard";
    config.run_user = "judge";
    config.require_isolation = true;

    runguard_request request;
    request.work_dir = "/tmp/box";
    request.command = {"python3", "-B", "main.py"};
    request.wall_time_soft = 2;
    request.wall_time_hard = 2.5;
    request.cpu_time = 2;
    request.memory_limit = 131072;
    request.stdin_file = "/tmp/io/stdin";
    request.stdout_file = "/tmp/io/run.out";
    request.stderr_file = "/tmp/io/run.err";
    request.metafile = "/tmp/io/run.meta";

    vector<string> args = runguard_arguments(config, request);
    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args.front(), "/opt/runguard");

    auto value_of = [&](const string &option) -> string {
        auto it = find(args.begin(), args.end(), option);
        if (it == args.end() || it + 1 == args.end()) return "";
        return *(it + 1);
    };
    EXPECT_EQ(value_of("--user"), "judge");
    EXPECT_EQ(value_of("--nproc"), "64");
    EXPECT_EQ(value_of("--wall-time"), "2.000:2.500");
    EXPECT_EQ(value_of("--cpu-time"), "2.000");
    EXPECT_EQ(value_of("--memory-limit"), "131072");
    EXPECT_EQ(value_of("--work-dir"), "/tmp/box");
    EXPECT_EQ(value_of("--standard-input-file"), "/tmp/io/stdin");
    EXPECT_EQ(value_of("--out-meta"), "/tmp/io/run.meta");
    EXPECT_NE(find(args.begin(), args.end(), "--no-network"), args.end());
    EXPECT_NE(find(args.begin(), args.end(), "--require-isolation"), args.end());
    EXPECT_EQ(find(args.begin(), args.end(), "--root"), args.end());

    // 选手程序的命令在 "--" 之后，不会被当作 runguard 的选项
    vector<string> tail(args.end() - 4, args.end());
    EXPECT_EQ(tail, (vector<string>{"--", "python3", "-B", "main.py"}));
}
