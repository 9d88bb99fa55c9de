#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    quizjudge::setup_test_environment();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(quizjudge::SCRATCH_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
