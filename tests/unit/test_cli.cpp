#include "TestFixtures.hpp"
#include "nc-validator/SchemaYaml.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <sys/wait.h>

using namespace ncvalidator;
using namespace ncvalidator::test;

class CliTest : public TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    template_ = write_file("template.yaml",
                           SchemaYaml::dump(make_glider_template()));
    good_ = write_file("good.yaml", SchemaYaml::dump(make_glider_template()));

    DataFile strict = make_glider_template();
    strict.variables.emplace_back(
        "salinity", make_variable(DataType::Float32, {"time"}, {"units"}));
    strict_ = write_file("strict.yaml", SchemaYaml::dump(strict));
  }

  // Runs nc-validate from the scratch directory, capturing both streams
  int run_cli(const std::string &args) {
    std::string cmd = "cd '" + dir_.string() + "' && '" + NC_VALIDATE_BIN +
                      "' " + args + " > '" + path("stdout.txt") + "' 2> '" +
                      path("stderr.txt") + "'";
    int ret = std::system(cmd.c_str());
    if (ret == -1 || !WIFEXITED(ret))
      return -1;
    return WEXITSTATUS(ret);
  }

  std::string read(const std::string &name) const {
    std::ifstream fin(path(name));
    std::stringstream ss;
    ss << fin.rdbuf();
    return ss.str();
  }

  std::string out() const { return read("stdout.txt"); }
  std::string err() const { return read("stderr.txt"); }

  std::string template_;
  std::string good_;
  std::string strict_;
};

TEST_F(CliTest, HelpExitsZero) {
  EXPECT_EQ(run_cli("--help"), 0);
  EXPECT_NE(out().find("Usage:"), std::string::npos);
  EXPECT_NE(out().find("--template"), std::string::npos);
}

TEST_F(CliTest, UnknownOptionPrintsUsage) {
  EXPECT_EQ(run_cli("--bogus " + good_), 1);
  EXPECT_NE(err().find("Unknown option --bogus"), std::string::npos);
  EXPECT_NE(out().find("Usage:"), std::string::npos);
}

TEST_F(CliTest, MissingOptionValueExitsOne) {
  EXPECT_EQ(run_cli("-t"), 1);
  EXPECT_NE(err().find("-t requires a value"), std::string::npos);
  EXPECT_NE(out().find("Usage:"), std::string::npos);
}

TEST_F(CliTest, NoFilesExitsOne) {
  EXPECT_EQ(run_cli("-t " + template_), 1);
  EXPECT_NE(err().find("No NetCDF files specified for validation"),
            std::string::npos);
}

TEST_F(CliTest, TemplateFlagValidatesFile) {
  EXPECT_EQ(run_cli("-t " + template_ + " " + good_), 0);
  EXPECT_NE(out().find("Validating against: " + template_), std::string::npos);
  EXPECT_NE(out().find("Valid file: " + good_), std::string::npos);
}

TEST_F(CliTest, InvalidFileStillExitsZero) {
  EXPECT_EQ(run_cli("--template " + strict_ + " " + good_), 0);
  EXPECT_NE(out().find("INVALID file: " + good_), std::string::npos);
  EXPECT_NE(err().find("VariableError: Missing variable: salinity"),
            std::string::npos);
}

TEST_F(CliTest, ConfigTemplateIsUsed) {
  auto config = write_file("validator.yaml", "template: " + strict_ + "\n");
  EXPECT_EQ(run_cli("-c " + config + " " + good_), 0);
  EXPECT_NE(out().find("Validating against: " + strict_), std::string::npos);
  EXPECT_NE(out().find("INVALID file: " + good_), std::string::npos);
}

TEST_F(CliTest, TemplateFlagOverridesConfig) {
  auto config = write_file("validator.yaml", "template: " + strict_ + "\n");
  EXPECT_EQ(run_cli("-c " + config + " -t " + template_ + " " + good_), 0);
  EXPECT_NE(out().find("Validating against: " + template_), std::string::npos);
  EXPECT_NE(out().find("Valid file: " + good_), std::string::npos);
}

TEST_F(CliTest, BadConfigExitsOne) {
  auto config = write_file("validator.yaml", "template: [a, b]\n");
  EXPECT_EQ(run_cli("-c " + config + " " + good_), 1);
  EXPECT_NE(err().find("Error:"), std::string::npos);
}

TEST_F(CliTest, NoLogFileUnlessRequested) {
  EXPECT_EQ(run_cli("-t " + template_ + " " + good_), 0);
  for (const auto &entry : std::filesystem::directory_iterator(dir_))
    EXPECT_NE(entry.path().extension().string(), ".log") << entry.path();

  EXPECT_EQ(run_cli("--log-file run.log --log-level debug -t " + template_ +
                    " " + good_),
            0);
  EXPECT_TRUE(std::filesystem::exists(dir_ / "run.log"));
}

TEST_F(CliTest, JsonFlagWritesReport) {
  EXPECT_EQ(run_cli("-t " + template_ + " --json report.json " + good_ +
                    " missing.nc"),
            0);
  EXPECT_TRUE(std::filesystem::exists(dir_ / "report.json"));
  EXPECT_NE(out().find("INVALID file: missing.nc"), std::string::npos);
}
