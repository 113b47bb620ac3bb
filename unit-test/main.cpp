#include <glog/logging.h>
#include <memory>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 降级执行器的测试需要嵌入的 Python 解释器
    interpreter = std::make_unique<grader::python_interpreter>();
  }
  virtual void TearDown() {
    interpreter.reset();
  }

 private:
  std::unique_ptr<grader::python_interpreter> interpreter;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
