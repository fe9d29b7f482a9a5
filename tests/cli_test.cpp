#include <codestat/cli.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace codestat {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::StartsWith;
using test::Lines;

std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  std::ostringstream buffer;
  buffer << stream.rdbuf();
  return buffer.str();
}

TEST(ParseArgumentsTest, ParsesRootAndFlags) {
  const auto options = ParseArguments(
      {"src", "-e", "py,.JS", "--ext", "md", "-i", "vendor,third_party", "-q",
       "--format", "json", "--out", "report.json", "--log-level", "info"});

  ASSERT_TRUE(options.root.has_value());
  EXPECT_EQ("src", options.root->string());
  EXPECT_THAT(options.extensions, ElementsAre(".py", ".js", ".md"));
  EXPECT_THAT(options.ignored_directories,
              ElementsAre("vendor", "third_party"));
  EXPECT_EQ(std::optional<bool>(true), options.quiet);
  EXPECT_EQ(std::optional<ReportFormat>(ReportFormat::kJson), options.format);
  EXPECT_EQ("report.json", options.output_file->string());
  EXPECT_EQ(std::optional<LogLevel>(LogLevel::kInfo), options.log_level);
}

TEST(ParseArgumentsTest, DefaultsLeaveEverythingUnset) {
  const auto options = ParseArguments({});

  EXPECT_FALSE(options.root.has_value());
  EXPECT_THAT(options.extensions, IsEmpty());
  EXPECT_FALSE(options.quiet.has_value());
  EXPECT_FALSE(options.format.has_value());
  EXPECT_FALSE(options.show_help);
}

TEST(ParseArgumentsTest, DebugFlagRaisesLogLevel) {
  EXPECT_EQ(std::optional<LogLevel>(LogLevel::kDebug),
            ParseArguments({"--debug"}).log_level);
}

TEST(ParseArgumentsTest, RejectsUnknownFlagsAndExtraPaths) {
  EXPECT_THROW(ParseArguments({"--bogus"}), std::invalid_argument);
  EXPECT_THROW(ParseArguments({"one", "two"}), std::invalid_argument);
  EXPECT_THROW(ParseArguments({"--ext"}), std::invalid_argument);
  EXPECT_THROW(ParseArguments({"--format", "xml"}), std::invalid_argument);
}

TEST(ParseLogLevelTest, AcceptsKnownNames) {
  EXPECT_EQ(LogLevel::kWarn, ParseLogLevel("WARNING"));
  EXPECT_EQ(LogLevel::kError, ParseLogLevel(" error "));
  EXPECT_THROW(ParseLogLevel("loud"), std::invalid_argument);
}

class CliConfigTest : public ::testing::Test {
protected:
  test::TemporaryProject project_;
};

TEST_F(CliConfigTest, ReadsYamlConfigWithAliases) {
  const auto config = project_.AddFile(
      "codestat.yaml", "root: src\n"
                       "ext: [py, .MD]\n"
                       "ignore-dirs: vendor\n"
                       "quiet: yes\n"
                       "format: JSON\n"
                       "output:\n"
                       "  path: out/report.json\n"
                       "log_level: debug\n");

  const auto options = ParseConfigFile(config);

  EXPECT_EQ("src", options.root->string());
  EXPECT_THAT(options.extensions, ElementsAre(".py", ".md"));
  EXPECT_THAT(options.ignored_directories, ElementsAre("vendor"));
  EXPECT_EQ(std::optional<bool>(true), options.quiet);
  EXPECT_EQ(std::optional<ReportFormat>(ReportFormat::kJson), options.format);
  EXPECT_EQ("out/report.json", options.output_file->string());
  EXPECT_EQ(std::optional<LogLevel>(LogLevel::kDebug), options.log_level);
}

TEST_F(CliConfigTest, RejectsUnknownKeys) {
  const auto config = project_.AddFile("codestat.yml", "colour: red\n");

  try {
    ParseConfigFile(config);
    FAIL() << "expected invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: colour"));
    EXPECT_THAT(error.what(), HasSubstr("extensions"));
  }
}

TEST_F(CliConfigTest, RejectsMissingAndUnsupportedFiles) {
  const auto toml = project_.AddFile("codestat.toml", "root = 'src'\n");

  EXPECT_THROW(ParseConfigFile(project_.root() / "absent.yaml"),
               std::runtime_error);
  EXPECT_THROW(ParseConfigFile(toml), std::invalid_argument);
}

TEST_F(CliConfigTest, CommandLineWinsOverConfig) {
  const auto config = project_.AddFile(
      "codestat.yaml", "root: from-config\nquiet: true\nextensions: py\n");

  const auto cli = ParseArguments(
      {"from-cli", "--verbose", "--config", config.string()});
  const auto options = ResolveOptions(cli);

  EXPECT_EQ("from-cli", options.root->string());
  EXPECT_EQ(std::optional<bool>(false), options.quiet);
  EXPECT_THAT(options.extensions, ElementsAre(".py"));
}

class RunCliTest : public ::testing::Test {
protected:
  int Run(std::vector<std::string> arguments) {
    output_.str("");
    log_.str("");
    return RunCli(arguments, output_, log_);
  }

  test::TemporaryProject project_;
  std::ostringstream output_;
  std::ostringstream log_;
};

TEST_F(RunCliTest, PrintsVerboseReport) {
  project_.AddFile("app.py", "\"\"\"App.\"\"\"\n# note\n\ndef main():\n"
                             "    return 0\n");
  project_.AddFile("lib/util.js", Lines(4, "let x = 1;"));

  EXPECT_EQ(kExitSuccess, Run({project_.root().string()}));

  EXPECT_THAT(output_.str(), HasSubstr("Analyzing project..."));
  EXPECT_THAT(output_.str(), HasSubstr("CodeStat - Project Analysis"));
  EXPECT_THAT(output_.str(), HasSubstr("|-- app.py"));
  EXPECT_THAT(output_.str(), HasSubstr("lib/ (1 files, 4 lines)"));
  EXPECT_THAT(output_.str(), HasSubstr("Total Files: 2"));
}

TEST_F(RunCliTest, QuietJsonReportSkipsTheBanner) {
  project_.AddFile("app.py", Lines(3));

  EXPECT_EQ(kExitSuccess,
            Run({project_.root().string(), "--quiet", "--format", "json"}));

  EXPECT_THAT(output_.str(), StartsWith("{\"project\": "));
  EXPECT_THAT(output_.str(), Not(HasSubstr("Analyzing project...")));
}

TEST_F(RunCliTest, WritesReportToFile) {
  project_.AddFile("src/app.py", Lines(3));
  const auto report = project_.root() / "report.json";

  EXPECT_EQ(kExitSuccess,
            Run({(project_.root() / "src").string(), "--format", "json",
                 "--out", report.string()}));

  EXPECT_THAT(ReadFile(report), HasSubstr("\"total_files\": 1"));
  EXPECT_THAT(output_.str(), Not(HasSubstr("total_files")));
}

TEST_F(RunCliTest, ExtensionFilterWithNoMatchesPrintsAdvice) {
  project_.AddFile("app.py", Lines(3));

  EXPECT_EQ(kExitSuccess, Run({project_.root().string(), "--ext", "rs"}));

  EXPECT_THAT(output_.str(), HasSubstr("Extensions: .rs"));
  EXPECT_THAT(output_.str(), HasSubstr("No files analyzed."));
}

TEST_F(RunCliTest, MissingRootPropagatesFilesystemError) {
  EXPECT_THROW(Run({(project_.root() / "missing").string()}),
               std::filesystem::filesystem_error);
}

TEST_F(RunCliTest, DebugLoggingGoesToTheLogStream) {
  project_.AddFile("app.py", Lines(1));

  EXPECT_EQ(kExitSuccess, Run({project_.root().string(), "-q", "--debug"}));

  EXPECT_THAT(log_.str(), HasSubstr("message=\"walk.complete\""));
  EXPECT_THAT(output_.str(), Not(HasSubstr("level=")));
}

TEST_F(RunCliTest, InformationalFlagsExitEarly) {
  EXPECT_EQ(kExitSuccess, Run({"--version"}));
  EXPECT_EQ("codestat 0.1.0\n", output_.str());

  EXPECT_EQ(kExitSuccess, Run({"--help"}));
  EXPECT_THAT(output_.str(), StartsWith("Usage: codestat"));

  EXPECT_EQ(kExitSuccess, Run({"--list-extensions"}));
  EXPECT_THAT(output_.str(), HasSubstr("Python:\n  .py, .pyi, .pyw"));
  EXPECT_THAT(output_.str(), HasSubstr("Other languages:"));
  EXPECT_THAT(output_.str(), HasSubstr("supported extensions"));
}

} // namespace
} // namespace codestat
