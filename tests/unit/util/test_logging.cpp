#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "notesd/util/logging.hpp"
#include "test_helpers.hpp"

using namespace notesd;
using namespace notesd::test;

class LoggingTest : public TempDirTest {
 protected:
  void TearDown() override {
    // Release the file sink before the directory goes away
    ASSERT_OK(util::initializeLogging("warn"));
    TempDirTest::TearDown();
  }
};

TEST_F(LoggingTest, InstallsNamedDefaultLogger) {
  ASSERT_OK(util::initializeLogging("debug"));
  EXPECT_EQ(spdlog::default_logger()->name(), "notesd");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST_F(LoggingTest, AcceptsOff) {
  ASSERT_OK(util::initializeLogging("off"));
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::off);
}

TEST_F(LoggingTest, RejectsUnknownLevel) {
  EXPECT_ERROR(util::initializeLogging("loud"), ErrorCode::kConfigError);
}

TEST_F(LoggingTest, CreatesLogFileDirectories) {
  auto log_file = temp_dir_ / "logs" / "nested" / "notesd.log";

  ASSERT_OK(util::initializeLogging("info", log_file));
  spdlog::info("written to file");
  spdlog::default_logger()->flush();

  EXPECT_TRUE(std::filesystem::exists(log_file));
  EXPECT_GT(std::filesystem::file_size(log_file), 0u);
}
