#include <curl/curl.h>
#include <glog/logging.h>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    tutor::setup_test_environment();
  }
  virtual void TearDown() {
    tutor::teardown_test_environment();
    curl_global_cleanup();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  // 静态分析需要嵌入的 Python 解释器，必须在所有测试之前初始化
  tutor::python_interpreter interpreter(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
