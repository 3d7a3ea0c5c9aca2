#include <gtest/gtest.h>

#include <configuration/command_line.h>
#include <configuration/config.h>

#include <nlohmann/json.hpp>

#include <fstream>

using namespace dapsync;
using namespace dapsync::cfg;
using namespace std::chrono_literals;

struct ParsedCommandLine
{
  CommandLineRegistry mParser{};
  std::unique_ptr<InitializationConfiguration> mConfig{ InitializationConfiguration::ConfigureWithParser(mParser) };
  CommandLineResult mResult{};

  template <size_t N>
  explicit ParsedCommandLine(const std::array<const char *, N> &argv)
  {
    mResult = mParser.Parse(static_cast<int>(N), const_cast<const char **>(argv.data()));
  }
};

static Path
WriteTempFile(std::string_view name, std::string_view contents)
{
  const Path path = Path{ ::testing::TempDir() } / name;
  std::ofstream file{ path, std::ios::trunc };
  file << contents;
  return path;
}

TEST(CommandLine, ParsesOptionsAndAdapterCommand)
{
  const std::array argv = { "dapsync", "-H", "10.0.0.5", "--port=9000", "-r", "rip, pc", "-i", "250", "-a", "--",
    "gdb", "--interpreter=dap" };
  ParsedCommandLine parsed{ argv };

  ASSERT_TRUE(parsed.mResult.mErrors.empty());
  const auto &cli = parsed.mConfig->mCommandLine;
  EXPECT_EQ(cli.mViewerHost, "10.0.0.5");
  EXPECT_EQ(cli.mViewerPort, 9000);
  EXPECT_EQ(cli.mRegisterCandidates, (std::vector<std::string>{ "rip", "pc" }));
  EXPECT_EQ(cli.mRetryInterval, 250ms);
  EXPECT_TRUE(parsed.mConfig->mAutoEnableFlag);
  EXPECT_EQ(parsed.mResult.mTrailingArguments, (std::vector<std::string>{ "gdb", "--interpreter=dap" }));
}

TEST(CommandLine, ProgramNameIsNotAnArgument)
{
  const std::array argv = { "--help" };
  ParsedCommandLine parsed{ argv };
  EXPECT_TRUE(parsed.mResult.mErrors.empty());
  EXPECT_FALSE(parsed.mConfig->mPrintHelp);
}

TEST(CommandLine, OptionsAfterDoubleDashBelongToTheAdapter)
{
  const std::array argv = { "dapsync", "--", "lldb-dap", "-p", "0" };
  ParsedCommandLine parsed{ argv };
  EXPECT_TRUE(parsed.mResult.mErrors.empty());
  EXPECT_FALSE(parsed.mConfig->mCommandLine.mViewerPort.has_value());
  EXPECT_EQ(parsed.mResult.mTrailingArguments, (std::vector<std::string>{ "lldb-dap", "-p", "0" }));
}

TEST(CommandLine, ReportsEveryBadArgument)
{
  const std::array argv = { "dapsync", "-p", "0", "--bogus", "-i", "soon", "-H" };
  ParsedCommandLine parsed{ argv };

  ASSERT_EQ(parsed.mResult.mErrors.size(), 4);
  EXPECT_EQ(parsed.mResult.mErrors[0].mError, ParseErrorType::OutOfRange);
  EXPECT_EQ(parsed.mResult.mErrors[1].mError, ParseErrorType::UnrecognizedArgument);
  EXPECT_EQ(parsed.mResult.mErrors[2].mError, ParseErrorType::InvalidFormat);
  EXPECT_EQ(parsed.mResult.mErrors[3].mError, ParseErrorType::MissingArgValue);
  EXPECT_EQ(fmt::format("{}", parsed.mResult.mErrors[1]), "Parse error: Argument is not a recognized option. --bogus");
}

TEST(CommandLine, OneShotModes)
{
  const std::array argv = { "dapsync", "--goto", " 0x401020 <main> ", "--script-path" };
  ParsedCommandLine parsed{ argv };
  ASSERT_TRUE(parsed.mResult.mErrors.empty());
  EXPECT_EQ(parsed.mConfig->mGotoAddress, "0x401020 <main>");
  EXPECT_TRUE(parsed.mConfig->mPrintScriptPath);
}

TEST(Configuration, DefaultsWithoutFileOrOptions)
{
  const std::array argv = { "dapsync" };
  ParsedCommandLine parsed{ argv };
  ASSERT_TRUE(parsed.mConfig->Resolve("/usr/share/dapsync").has_value());

  const auto &sync = parsed.mConfig->mSync;
  EXPECT_EQ(sync.mViewerHost, "127.0.0.1");
  EXPECT_EQ(sync.mViewerPort, 18888);
  EXPECT_EQ(sync.mRegisterCandidates, (std::vector<std::string>{ "pc", "rip", "eip", "r15" }));
  EXPECT_EQ(sync.mRetryInterval, 3000ms);
  EXPECT_FALSE(sync.mAutoEnable);
  EXPECT_EQ(sync.CompanionScriptPath(), Path{ "/usr/share/dapsync/ghidra_start_goto_server.py" });
}

TEST(Configuration, CommandLineWinsOverFile)
{
  const auto path = WriteTempFile("dapsync-precedence.json",
    R"({ "host": "file-host", "port": 1234, "retryInterval": 1000, "registers": "x0, pc", "autoEnable": true })");
  const auto pathString = path.string();
  const std::array argv = { "dapsync", "-c", pathString.c_str(), "-p", "4321", "-s", "/srv/scripts" };
  ParsedCommandLine parsed{ argv };
  ASSERT_TRUE(parsed.mResult.mErrors.empty());
  ASSERT_TRUE(parsed.mConfig->Resolve("/usr/share/dapsync").has_value());

  const auto &sync = parsed.mConfig->mSync;
  EXPECT_EQ(sync.mViewerHost, "file-host");
  EXPECT_EQ(sync.mViewerPort, 4321);
  EXPECT_EQ(sync.mRetryInterval, 1000ms);
  EXPECT_EQ(sync.mRegisterCandidates, (std::vector<std::string>{ "x0", "pc" }));
  EXPECT_TRUE(sync.mAutoEnable);
  EXPECT_EQ(sync.mScriptDirectory, Path{ "/srv/scripts" });
}

TEST(Configuration, MissingConfigFileIsAParseError)
{
  const std::array argv = { "dapsync", "-c", "/definitely/not/here.json" };
  ParsedCommandLine parsed{ argv };
  ASSERT_EQ(parsed.mResult.mErrors.size(), 1);
  EXPECT_EQ(parsed.mResult.mErrors[0].mError, ParseErrorType::FileDoesNotExist);
}

TEST(Configuration, UnreadableAndMalformedFiles)
{
  auto missing = ReadConfigurationFile("/definitely/not/here.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().mKind, ConfigFileError::Kind::Unreadable);

  auto malformed = ReadConfigurationFile(WriteTempFile("dapsync-malformed.json", "{ \"host\": "));
  ASSERT_FALSE(malformed.has_value());
  EXPECT_EQ(malformed.error().mKind, ConfigFileError::Kind::Malformed);

  auto notAnObject = ReadConfigurationFile(WriteTempFile("dapsync-array.json", "[1, 2]"));
  ASSERT_FALSE(notAnObject.has_value());
  EXPECT_EQ(notAnObject.error().mKind, ConfigFileError::Kind::Malformed);
}

TEST(Configuration, RejectsInvalidValues)
{
  for (const auto *text : { R"({"port": 0})", R"({"port": 70000})", R"({"port": "80"})", R"({"host": ""})",
         R"({"registers": []})", R"({"registers": [1]})", R"({"registers": " , "})", R"({"retryInterval": 0})",
         R"({"retryInterval": 1.5})", R"({"retryInterval": 10000000000000})",
         R"({"retryInterval": 4294967296})", R"({"autoEnable": "yes"})", R"({"scriptDirectory": 3})" }) {
    const auto result = OverridesFromJson(nlohmann::json::parse(text));
    ASSERT_FALSE(result.has_value()) << text;
    EXPECT_EQ(result.error().mKind, ConfigFileError::Kind::InvalidValue) << text;
  }
}

TEST(Configuration, UnknownKeysAreIgnored)
{
  const auto result = OverridesFromJson(nlohmann::json::parse(R"({"colour": "blue", "port": 7000})"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->mViewerPort, 7000);
  EXPECT_FALSE(result->mViewerHost.has_value());
}

TEST(Configuration, RuntimeConfigurationMergesOverDefaults)
{
  SyncConfiguration defaults{};
  defaults.mViewerPort = 5000;
  defaults.mScriptDirectory = "/opt/dapsync";

  const auto merged =
    ConfigurationFromJson(nlohmann::json::parse(R"({"host": "ghidra.lan", "registers": ["x0"]})"), defaults);
  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(merged->mViewerHost, "ghidra.lan");
  EXPECT_EQ(merged->mViewerPort, 5000);
  EXPECT_EQ(merged->mRegisterCandidates, std::vector<std::string>{ "x0" });
  EXPECT_EQ(merged->mScriptDirectory, Path{ "/opt/dapsync" });

  EXPECT_FALSE(ConfigurationFromJson(nlohmann::json::parse(R"({"port": -1})"), defaults).has_value());
}

TEST(Configuration, RetryIntervalAcceptsTheCommandLineRange)
{
  const auto largest = OverridesFromJson(nlohmann::json::parse(R"({"retryInterval": 4294967295})"));
  ASSERT_TRUE(largest.has_value());
  EXPECT_EQ(largest->mRetryInterval, std::chrono::milliseconds{ 4294967295 });

  SyncConfiguration defaults{};
  EXPECT_FALSE(
    ConfigurationFromJson(nlohmann::json::parse(R"({"retryInterval": 10000000000000})"), defaults).has_value());
}
