#include "TestFixtures.hpp"
#include "nc-validator/Config.hpp"
#include "nc-validator/Logger.hpp"
#include <gtest/gtest.h>

using namespace ncvalidator;
using namespace ncvalidator::test;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, DefaultsWithoutFile) {
  ValidatorConfig config;
  EXPECT_EQ(config.template_path, "./templates/IOOS_Glider_NetCDF_v2.0.nc");
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_TRUE(config.json_report.empty());
}

TEST_F(ConfigTest, FileOverridesDefaults) {
  auto path = write_file("validator.yaml", R"(
template: /data/templates/glider.yaml
log_level: debug
json_report: report.json
)");
  auto config = load_config(path);
  EXPECT_EQ(config.template_path, "/data/templates/glider.yaml");
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_EQ(config.json_report, "report.json");
}

TEST_F(ConfigTest, EmptyFileKeepsBase) {
  auto path = write_file("empty.yaml", "");
  ValidatorConfig base;
  base.template_path = "custom.nc";
  auto config = load_config(path, base);
  EXPECT_EQ(config.template_path, "custom.nc");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
  auto path = write_file("extra.yaml", "template: t.nc\ncolour: blue\n");
  auto config = load_config(path);
  EXPECT_EQ(config.template_path, "t.nc");
}

TEST_F(ConfigTest, NonScalarValueThrows) {
  auto path = write_file("bad.yaml", "template: [a, b]\n");
  EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigTest, NonScalarKeyThrows) {
  auto path = write_file("key.yaml", "template: t.nc\n? [a, b]\n: value\n");
  EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(load_config(this->path("absent.yaml")), ConfigError);
}

TEST_F(ConfigTest, NonMapDocumentThrows) {
  auto path = write_file("list.yaml", "- template\n- t.nc\n");
  EXPECT_THROW(load_config(path), ConfigError);
}

TEST(LogLevelTest, ParseLogLevel) {
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
  EXPECT_EQ(parse_log_level("bogus"), spdlog::level::warn);
}

TEST(LoggerTest, LoggingBeforeInitIsNoop) {
  ValidatorLogger::instance().shutdown();
  EXPECT_FALSE(ValidatorLogger::instance().initialized());
  LOG_INFO("TEST", "NOOP", "value {}", 42);

  ValidatorLogger::instance().init("", spdlog::level::debug);
  EXPECT_TRUE(ValidatorLogger::instance().initialized());
  LOG_DEBUG("TEST", "INIT", "value {}", 42);
  ValidatorLogger::instance().shutdown();
  EXPECT_FALSE(ValidatorLogger::instance().initialized());
}
