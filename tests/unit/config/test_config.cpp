#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "notesd/config/config.hpp"
#include "test_helpers.hpp"

using namespace notesd::config;
using namespace notesd::test;
using notesd::ErrorCode;

class ConfigTest : public TempDirTest {
 protected:
  std::filesystem::path writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.toml";
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8000);
  EXPECT_EQ(config.server.threads, 0);
  EXPECT_EQ(config.cors.allow_origins, std::vector<std::string>{"*"});
  EXPECT_TRUE(config.cors.allow_credentials);
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.file.empty());
  EXPECT_TRUE(config.configPath().empty());
  EXPECT_OK(config.validate());
  EXPECT_GE(config.effectiveThreads(), 1);
}

TEST_F(ConfigTest, LoadOverridesDefaults) {
  auto path = writeConfig(R"(
[server]
host = "127.0.0.1"
port = 9090
threads = 4
body_limit = 4096
idle_timeout_seconds = 5

[cors]
allow_origins = ["https://a.example", "https://b.example"]
allow_credentials = false

[logging]
level = "debug"
file = "/tmp/notesd.log"
)");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 9090);
  EXPECT_EQ(config.server.threads, 4);
  EXPECT_EQ(config.server.body_limit, 4096);
  EXPECT_EQ(config.server.idle_timeout_seconds, 5);
  EXPECT_EQ(config.cors.allow_origins,
            (std::vector<std::string>{"https://a.example", "https://b.example"}));
  EXPECT_FALSE(config.cors.allow_credentials);
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.file.string(), "/tmp/notesd.log");
  EXPECT_EQ(config.configPath().string(), path.string());
  EXPECT_EQ(config.effectiveThreads(), 4);
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
  auto path = writeConfig("[server]\nport = 8123\n");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.server.port, 8123);
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, EnvReference) {
  setenv("NOTESD_TEST_HOST", "10.1.2.3", 1);
  auto path = writeConfig("[server]\nhost = \"env:NOTESD_TEST_HOST\"\n");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.server.host, "10.1.2.3");
  unsetenv("NOTESD_TEST_HOST");
}

TEST_F(ConfigTest, MissingFile) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MalformedToml) {
  auto path = writeConfig("[server\nport = ");
  Config config;
  EXPECT_ERROR(config.load(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
  Config bad_port;
  bad_port.server.port = 70000;
  EXPECT_ERROR(bad_port.validate(), ErrorCode::kConfigError);

  Config bad_threads;
  bad_threads.server.threads = -1;
  EXPECT_ERROR(bad_threads.validate(), ErrorCode::kConfigError);

  Config bad_host;
  bad_host.server.host.clear();
  EXPECT_ERROR(bad_host.validate(), ErrorCode::kConfigError);

  Config bad_level;
  bad_level.logging.level = "loud";
  EXPECT_ERROR(bad_level.validate(), ErrorCode::kConfigError);

  Config bad_timeout;
  bad_timeout.server.idle_timeout_seconds = 0;
  EXPECT_ERROR(bad_timeout.validate(), ErrorCode::kConfigError);

  Config bad_body;
  bad_body.server.body_limit = 0;
  EXPECT_ERROR(bad_body.validate(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, DefaultPathHonoursXdg) {
  const char* previous = std::getenv("XDG_CONFIG_HOME");
  std::string saved = previous ? previous : "";

  setenv("XDG_CONFIG_HOME", temp_dir_.c_str(), 1);
  EXPECT_EQ(Config::defaultConfigPath().string(), (temp_dir_ / "notesd" / "config.toml").string());

  if (previous) {
    setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  } else {
    unsetenv("XDG_CONFIG_HOME");
  }
}

TEST_F(ConfigTest, LogLevels) {
  for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
    EXPECT_TRUE(Config::isValidLogLevel(level)) << level;
  }
  EXPECT_FALSE(Config::isValidLogLevel("verbose"));
  EXPECT_FALSE(Config::isValidLogLevel(""));
}
