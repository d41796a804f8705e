#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace execjudge;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::unique_temp_dir("execjudge-config");
    }

    void TearDown() override {
        fs::remove_all(dir);
        for (auto key : {"EXECJUDGE_TIME_LIMIT", "EXECJUDGE_WORKERS", "EXECJUDGE_SCRATCH_DIR"})
            unsetenv(key);
    }

    fs::path dir;
};

TEST_F(ConfigTest, Defaults) {
    engine_config config = default_config();
    EXPECT_EQ(config.time_limit, 5);
    EXPECT_EQ(config.memory_limit, 128);
    EXPECT_GE(config.workers, 1u);
    EXPECT_EQ(config.compile_timeout, 10);
    EXPECT_FALSE(config.scratch_dir.empty());
    EXPECT_FALSE(config.require_isolation);
}

TEST_F(ConfigTest, Environment) {
    engine_config config = default_config();
    setenv("EXECJUDGE_TIME_LIMIT", "2.5", 1);
    setenv("EXECJUDGE_WORKERS", "3", 1);
    setenv("EXECJUDGE_SCRATCH_DIR", "/var/tmp/judge", 1);
    load_config_env(config);
    EXPECT_EQ(config.time_limit, 2.5);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.scratch_dir, "/var/tmp/judge");

    setenv("EXECJUDGE_WORKERS", "many", 1);
    EXPECT_THROW(load_config_env(config), invalid_argument);
}

TEST_F(ConfigTest, File) {
    fs::path file = dir / "config.json";
    write_file_content(file, R"({"time_limit": 1, "queue_capacity": 10, "runguard": "/opt/runguard"})");

    engine_config config = default_config();
    load_config_file(config, file);
    EXPECT_EQ(config.time_limit, 1);
    EXPECT_EQ(config.queue_capacity, 10u);
    EXPECT_EQ(config.runguard, "/opt/runguard");
    // 文件中没有的键保持不变
    EXPECT_EQ(config.memory_limit, 128);

    EXPECT_THROW(load_config_file(config, dir / "missing.json"), runtime_error);
    write_file_content(file, "{ not json");
    EXPECT_THROW(load_config_file(config, file), runtime_error);
}

TEST_F(ConfigTest, Validate) {
    engine_config config = default_config();
    config.runguard = "/opt/runguard";
    EXPECT_NO_THROW(validate_config(config));

    engine_config bad = config;
    bad.time_limit = 0;
    EXPECT_THROW(validate_config(bad), invalid_argument);

    bad = config;
    bad.runguard.clear();
    EXPECT_THROW(validate_config(bad), invalid_argument);

    bad = config;
    bad.chroot_dir = dir / "no-such-root";
    EXPECT_THROW(validate_config(bad), invalid_argument);
}
