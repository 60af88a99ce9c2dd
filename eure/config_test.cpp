#include "gtest/gtest.h"
#include "config.hpp"
#include <fstream>

using namespace eure;

TEST(ConfigTest, TestDefaults)
{
  auto cfg = load_config_string("");
  ASSERT_TRUE(cfg) << cfg.error();
  EXPECT_EQ(cfg->tag_mode, union_tag_mode::Explicit);
  EXPECT_EQ(cfg->max_depth, 256u);
  EXPECT_EQ(cfg->max_errors, 0u);
  EXPECT_EQ(cfg->log_level, spdlog::level::info);
  EXPECT_FALSE(cfg->log_file);
}

TEST(ConfigTest, TestAllKeys)
{
  auto cfg = load_config_string("union-tag-mode: lenient\n"
                                "max-depth: 32\n"
                                "max-errors: 5\n"
                                "log-level: debug\n"
                                "log-file: eure.log\n");
  ASSERT_TRUE(cfg) << cfg.error();
  EXPECT_EQ(cfg->tag_mode, union_tag_mode::Lenient);
  EXPECT_EQ(cfg->max_depth, 32u);
  EXPECT_EQ(cfg->max_errors, 5u);
  EXPECT_EQ(cfg->log_level, spdlog::level::debug);
  ASSERT_TRUE(cfg->log_file);
  EXPECT_EQ(cfg->log_file->string(), "eure.log");
}

TEST(ConfigTest, TestUnknownKeysAreIgnored)
{
  auto cfg = load_config_string("colour: blue\nmax-errors: 1\n");
  ASSERT_TRUE(cfg) << cfg.error();
  EXPECT_EQ(cfg->max_errors, 1u);
}

TEST(ConfigTest, TestInvalidValues)
{
  EXPECT_FALSE(load_config_string("union-tag-mode: guess\n"));
  EXPECT_FALSE(load_config_string("max-depth: 0\n"));
  EXPECT_FALSE(load_config_string("max-depth: deep\n"));
  EXPECT_FALSE(load_config_string("max-errors: -1\n"));
  EXPECT_FALSE(load_config_string("log-level: loud\n"));
  EXPECT_FALSE(load_config_string("log-file: [a, b]\n"));
  EXPECT_FALSE(load_config_string("- not\n- a map\n"));
  EXPECT_FALSE(load_config_string("key: [unterminated\n"));
}

TEST(ConfigTest, TestLogLevelOff)
{
  auto cfg = load_config_string("log-level: off\n");
  ASSERT_TRUE(cfg) << cfg.error();
  EXPECT_EQ(cfg->log_level, spdlog::level::off);
}

TEST(ConfigTest, TestLoadFile)
{
  const auto path = std::filesystem::temp_directory_path() / "eure_config_test.yaml";
  {
    std::ofstream out(path);
    out << "union-tag-mode: explicit\nmax-depth: 8\n";
  }
  auto cfg = load_config_file(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(cfg) << cfg.error();
  EXPECT_EQ(cfg->max_depth, 8u);

  EXPECT_FALSE(load_config_file(std::filesystem::temp_directory_path() / "eure_missing_config.yaml"));
}

TEST(ConfigTest, TestConfigureLogging)
{
  config cfg;
  cfg.log_level = spdlog::level::debug;
  cfg.log_file  = std::filesystem::temp_directory_path() / "eure_logging_test.log";

  ASSERT_TRUE(configure_logging(cfg));
  EXPECT_EQ(spdlog::default_logger()->name(), "eurelog");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
  EXPECT_EQ(spdlog::default_logger()->sinks().size(), 2u);

  spdlog::set_default_logger(std::make_shared<spdlog::logger>("test", spdlog::sinks_init_list{}));
  std::filesystem::remove(*cfg.log_file);
}
