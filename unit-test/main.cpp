#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "testrunner/config.hpp"

/**
 * --chdir changes the working directory of the whole test process;
 * put it back once all tests have run.
 */
class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    initial_dir = std::filesystem::current_path();
  }
  virtual void TearDown() {
    std::filesystem::current_path(initial_dir);
  }

 private:
  std::filesystem::path initial_dir;
};

int main(int argc, char *argv[]) {
  testrunner::load_environment();
  testrunner::init_logging(argv[0]);

  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
