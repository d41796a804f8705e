#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 沙箱测试的诊断信息直接输出到 stderr，不写日志文件
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::WARNING;
  }
  virtual void TearDown() {
    google::ShutdownGoogleLogging();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
