#include <configuration/config.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace dapc::cfg;

TEST(SplitCommandLine, SplitsOnWhitespace)
{
  const auto argv = SplitCommandLine("  python3 -m\tdebugpy.adapter  ");
  ASSERT_TRUE(argv.has_value());
  EXPECT_EQ(*argv, (std::vector<std::string>{ "python3", "-m", "debugpy.adapter" }));
}

TEST(SplitCommandLine, EmptyIsAnError)
{
  const auto argv = SplitCommandLine("   ");
  ASSERT_FALSE(argv.has_value());
  EXPECT_EQ(argv.error().mError, ParseErrorType::EmptyCommandLine);
}

TEST(ParseLogChannels, NamesAndAll)
{
  const auto some = ParseLogChannels("dap,session,dap");
  ASSERT_TRUE(some.has_value());
  EXPECT_EQ(*some, (std::vector<dapc::Channel>{ dapc::Channel::dap, dapc::Channel::session }));

  const auto all = ParseLogChannels("core,all");
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->size(), dapc::Enum<dapc::Channel>::Count());

  const auto none = ParseLogChannels("");
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->empty());
}

TEST(ParseLogChannels, UnknownChannel)
{
  const auto res = ParseLogChannels("core,verbose");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mError, ParseErrorType::InvalidFormat);
  ASSERT_EQ(res.error().mInputs.size(), 1);
  EXPECT_EQ(res.error().mInputs.front(), "verbose");
}

class CommandLineTest : public ::testing::Test
{
protected:
  std::filesystem::path mDebugee;

  void
  SetUp() override
  {
    mDebugee = std::filesystem::temp_directory_path() / "dapc-command-line-test-debugee";
    std::ofstream{ mDebugee } << "";
  }

  void
  TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove(mDebugee, ec);
  }
};

TEST_F(CommandLineTest, ParsesOptions)
{
  CommandLineRegistry registry{};
  auto config = InitializationConfiguration::ConfigureWithParser(registry);
  const auto debugee = mDebugee.string();
  const char *argv[] = { "dapc", "--adapter", "lldb-dap --port 0", "-d", debugee.c_str(), "--poll-interval=25",
    "--debug-connection" };
  const auto result = registry.Parse(std::size(argv), argv);
  ASSERT_TRUE(result.Ok());

  EXPECT_EQ(config->mAdapterCommandLine, (std::vector<std::string>{ "lldb-dap", "--port", "0" }));
  EXPECT_EQ(config->mDebugee, mDebugee);
  EXPECT_EQ(config->mPollIntervalMs, 25);
  EXPECT_TRUE(config->mDebugConnection);
  EXPECT_FALSE(config->mHelp);
  EXPECT_EQ(config->AdapterId(), "lldb-dap");
}

TEST_F(CommandLineTest, DefaultsApplyWhenOptionsAreAbsent)
{
  CommandLineRegistry registry{};
  auto config = InitializationConfiguration::ConfigureWithParser(registry);
  const char *argv[] = { "dapc" };
  ASSERT_TRUE(registry.Parse(std::size(argv), argv).Ok());
  EXPECT_TRUE(config->mAdapterCommandLine.empty());
  EXPECT_EQ(config->mPollIntervalMs, 50);
  EXPECT_FALSE(config->mDebugConnection);
  EXPECT_EQ(config->AdapterId(), "dapc");
}

TEST_F(CommandLineTest, ExplicitAdapterId)
{
  CommandLineRegistry registry{};
  auto config = InitializationConfiguration::ConfigureWithParser(registry);
  const char *argv[] = { "dapc", "-a", "/usr/local/bin/codelldb", "--adapter-id", "lldb" };
  ASSERT_TRUE(registry.Parse(std::size(argv), argv).Ok());
  EXPECT_EQ(config->AdapterId(), "lldb");
}

TEST_F(CommandLineTest, ReportsErrors)
{
  CommandLineRegistry registry{};
  auto config = InitializationConfiguration::ConfigureWithParser(registry);
  const char *argv[] = { "dapc", "--bogus", "-p", "fast", "-d", "/this/path/does/not/exist" };
  const auto result = registry.Parse(std::size(argv), argv);
  ASSERT_FALSE(result.Ok());
  ASSERT_EQ(result.mErrors.size(), 3);
  EXPECT_EQ(result.mErrors[0].mError, ParseErrorType::UnrecognizedArgument);
  EXPECT_EQ(result.mErrors[1].mError, ParseErrorType::InvalidFormat);
  EXPECT_EQ(result.mErrors[2].mError, ParseErrorType::FileDoesNotExist);
}

TEST_F(CommandLineTest, MissingValue)
{
  CommandLineRegistry registry{};
  auto config = InitializationConfiguration::ConfigureWithParser(registry);
  const char *argv[] = { "dapc", "--adapter" };
  const auto result = registry.Parse(std::size(argv), argv);
  ASSERT_EQ(result.mErrors.size(), 1);
  EXPECT_EQ(result.mErrors[0].mError, ParseErrorType::MissingArgValue);
}

TEST_F(CommandLineTest, LogChannelsFromEnvironment)
{
  CommandLineRegistry registry{};
  auto config = InitializationConfiguration::ConfigureWithParser(registry);
  ASSERT_EQ(setenv("DAPC_LOG", "session,warning", 1), 0);
  registry.ParseEnvironmentVariableOptions();
  unsetenv("DAPC_LOG");
  EXPECT_EQ(config->mLogChannels, (std::vector<dapc::Channel>{ dapc::Channel::session, dapc::Channel::warning }));
}

TEST(HelpMessage, WrapsAtWhitespace)
{
  const HelpMessage help{ "aaa bbb ccc\nddd" };
  const auto lines = help.CreateLinesOfWidth(8);
  EXPECT_EQ(lines, (std::vector<std::string_view>{ "aaa bbb", "ccc", "ddd" }));
}
