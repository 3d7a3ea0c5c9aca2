#include <gtest/gtest.h>

#include "sync_fakes.h"
#include <configuration/config.h>
#include <sync/failure_reporter.h>

using namespace dapsync;
using namespace dapsync::test;
using namespace std::chrono_literals;

static cfg::SyncConfiguration
TestConfiguration()
{
  cfg::SyncConfiguration config{};
  config.mScriptDirectory = "/opt/dapsync";
  return config;
}

TEST(FailureReporter, MessageTellsHowToStartTheServer)
{
  EXPECT_EQ(sync::ConnectionFailureReporter::FormatFailureMessage(TestConfiguration()),
    "Failed to connect to Ghidra server at 127.0.0.1:18888\n\n"
    "To start the Ghidra server:\n"
    "1. Open Ghidra Script Manager (Window > Script Manager)\n"
    "2. Run script: /opt/dapsync/ghidra_start_goto_server.py\n\n"
    "Retrying silently every 3s...");
}

TEST(FailureReporter, SubSecondIntervalsAreShownInMilliseconds)
{
  auto config = TestConfiguration();
  config.mViewerHost = "10.0.0.2";
  config.mViewerPort = 9000;
  config.mRetryInterval = 1500ms;
  const auto message = sync::ConnectionFailureReporter::FormatFailureMessage(config);
  EXPECT_TRUE(message.starts_with("Failed to connect to Ghidra server at 10.0.0.2:9000\n")) << message;
  EXPECT_TRUE(message.ends_with("Retrying silently every 1500ms...")) << message;
}

TEST(FailureReporter, WarnsOncePerEpisode)
{
  FakeNotifier notifier;
  sync::ConnectionFailureReporter reporter{ notifier };
  sync::SyncState state{};
  const auto config = TestConfiguration();

  EXPECT_TRUE(reporter.ReportFailure(state, config));
  EXPECT_FALSE(reporter.ReportFailure(state, config));
  EXPECT_FALSE(reporter.ReportFailure(state, config));
  ASSERT_EQ(notifier.mMessages.size(), 1);
  EXPECT_EQ(notifier.mMessages[0].first, sync::Severity::Warning);
  EXPECT_TRUE(state.mFailureEpisodeActive);

  sync::ConnectionFailureReporter::Clear(state);
  EXPECT_FALSE(state.mFailureEpisodeActive);
  EXPECT_TRUE(reporter.ReportFailure(state, config));
  EXPECT_EQ(notifier.Count(sync::Severity::Warning), 2);
}
