#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <spdlog/spdlog.h>

#include "vscore/config/session_config.hpp"

namespace vscore::config {
namespace {

namespace fs = std::filesystem;

class SessionConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("vscore_config_test_" +
             std::string(
                 ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  void WriteFile(const fs::path& relative_path, const std::string& content) {
    fs::path path = root_ / relative_path;
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
  }

  fs::path root_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(SessionConfigTest, EmptyFileGivesDefaults) {
  auto config = ParseConfig("", "vscore.toml");
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->session.trace_scoreboard);
  EXPECT_FALSE(config->session.ignore_duplicate_defs);
  EXPECT_TRUE(config->session.standard_library);
  EXPECT_EQ(config->logging.level, "info");
}

TEST_F(SessionConfigTest, ReadsEveryKey) {
  auto config = ParseConfig(
      "[session]\n"
      "trace_scoreboard = true\n"
      "ignore_duplicate_defs = true\n"
      "standard_library = false\n"
      "\n"
      "[logging]\n"
      "level = \"debug\"\n",
      "vscore.toml");
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  EXPECT_TRUE(config->session.trace_scoreboard);
  EXPECT_TRUE(config->session.ignore_duplicate_defs);
  EXPECT_FALSE(config->session.standard_library);
  EXPECT_EQ(config->logging.level, "debug");
}

TEST_F(SessionConfigTest, UnknownKeysAreIgnored) {
  auto config = ParseConfig(
      "[session]\nfuture_option = 3\n[tools]\nx = 1\n", "vscore.toml");
  EXPECT_TRUE(config.has_value());
}

TEST_F(SessionConfigTest, NonBooleanOptionIsAnError) {
  auto config =
      ParseConfig("[session]\nignore_duplicate_defs = 1\n", "vscore.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().primary.kind, DiagKind::kHostError);
  EXPECT_EQ(
      config.error().primary.message,
      "vscore.toml: 'ignore_duplicate_defs' must be a boolean");
}

TEST_F(SessionConfigTest, SessionMustBeATable) {
  auto config = ParseConfig("session = true\n", "vscore.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message, "vscore.toml: 'session' must be a table");
}

TEST_F(SessionConfigTest, UnknownLoggingLevel) {
  auto config = ParseConfig("[logging]\nlevel = \"loud\"\n", "vscore.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message,
      "vscore.toml: unknown logging level 'loud'");
  ASSERT_EQ(config.error().notes.size(), 1U);
}

TEST_F(SessionConfigTest, MalformedToml) {
  auto config = ParseConfig("[session\n", "vscore.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message.rfind("failed to parse vscore.toml", 0),
      0U);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SessionConfigTest, FindConfigWalksUp) {
  WriteFile("vscore.toml", "");
  fs::create_directories(root_ / "rtl" / "core");

  auto found = FindConfig(root_ / "rtl" / "core");
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(fs::equivalent(*found, root_ / "vscore.toml"));
}

TEST_F(SessionConfigTest, LoadConfigSetsRootDir) {
  WriteFile("vscore.toml", "[session]\nstandard_library = false\n");

  auto config = LoadConfig(root_ / "vscore.toml");
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->session.standard_library);
  EXPECT_EQ(config->root_dir, root_);
}

TEST_F(SessionConfigTest, LoadConfigReportsPath) {
  WriteFile("vscore.toml", "[logging]\nlevel = 3\n");

  auto config = LoadConfig(root_ / "vscore.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("'logging.level' must be a string"),
      std::string::npos);
}

TEST_F(SessionConfigTest, ApplyLoggingConfigSetsLevel) {
  spdlog::level::level_enum saved = spdlog::get_level();
  ApplyLoggingConfig({.level = "debug"});
  EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
  ApplyLoggingConfig({.level = "off"});
  EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
  spdlog::set_level(saved);
}

}  // namespace
}  // namespace vscore::config
