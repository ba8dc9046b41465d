#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "notesd/store/memory_store.hpp"

namespace notesd::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path temp_dir_;
};

// Clock the test advances by hand. Copies share the same current time, so a
// store built from clock() sees every advance()/set() made afterwards.
class ManualClock {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  explicit ManualClock(TimePoint start = TimePoint{std::chrono::seconds(1700000000)});

  TimePoint now() const;
  void advance(std::chrono::microseconds delta);
  void set(TimePoint time);

  // Callable suitable for MemoryStore
  store::MemoryStore::Clock clock() const;

 private:
  std::shared_ptr<std::atomic<TimePoint::rep>> ticks_;
};

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace notesd::test
