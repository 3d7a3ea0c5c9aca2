#include <gtest/gtest.h>

#include "sync_fakes.h"
#include <configuration/config.h>
#include <sync/session_lifecycle.h>

using namespace dapsync;
using namespace dapsync::test;
using namespace std::chrono_literals;

static cfg::SyncConfiguration
LifecycleConfiguration(bool autoEnable)
{
  cfg::SyncConfiguration config{};
  config.mAutoEnable = autoEnable;
  config.mScriptDirectory = "/opt/dapsync";
  return config;
}

class SessionLifecycleTest : public ::testing::Test
{
protected:
  FakeTransport transport;
  FakeTimerService timers;
  FakeNotifier notifier;
  FakeSessionHost first{ 1 };
  FakeSessionHost second{ 2 };
  std::unique_ptr<sync::SessionLifecycle> lifecycle;

  void
  Create(bool autoEnable)
  {
    lifecycle = std::make_unique<sync::SessionLifecycle>(transport, timers, notifier,
                                                         LifecycleConfiguration(autoEnable));
  }

  std::vector<std::string>
  Warnings() const
  {
    std::vector<std::string> result;
    for (const auto &[severity, message] : notifier.mMessages) {
      if (severity == sync::Severity::Warning) {
        result.push_back(message);
      }
    }
    return result;
  }
};

TEST_F(SessionLifecycleTest, SessionsStartWithTheGlobalEnabledFlag)
{
  Create(true);
  auto engine = lifecycle->OnSessionStarted(first);
  ASSERT_NE(engine, nullptr);
  EXPECT_TRUE(engine->IsEnabled());
  EXPECT_TRUE(engine->State().IsEmpty());

  lifecycle->SetEnabled(false);
  EXPECT_FALSE(lifecycle->OnSessionStarted(second)->IsEnabled());
}

TEST_F(SessionLifecycleTest, StartingTwiceKeepsTheEngine)
{
  Create(false);
  auto engine = lifecycle->OnSessionStarted(first);
  EXPECT_EQ(lifecycle->OnSessionStarted(first), engine);
  EXPECT_EQ(lifecycle->SessionCount(), 1);
}

TEST_F(SessionLifecycleTest, TerminationIsIdempotentAndLeavesNoTimers)
{
  Create(true);
  lifecycle->OnSessionStarted(first);
  first.mCurrentFrame = OuterFrame(1, "0x10");
  lifecycle->OnStopped(1);
  transport.Refuse();
  ASSERT_EQ(timers.Armed(), 1);

  lifecycle->OnSessionTerminated(1);
  lifecycle->OnSessionTerminated(1);
  lifecycle->OnSessionTerminated(42);
  EXPECT_EQ(timers.Armed(), 0);
  EXPECT_EQ(lifecycle->SessionCount(), 0);
  EXPECT_EQ(lifecycle->GetEngine(1), nullptr);
  timers.Advance(1min);
  EXPECT_EQ(transport.mSent.size(), 1);
}

TEST_F(SessionLifecycleTest, NextSessionStartsFromScratch)
{
  Create(true);
  lifecycle->OnSessionStarted(first);
  first.mCurrentFrame = TopFrame();
  lifecycle->OnStopped(1);
  first.Respond("$pc", std::string{ "0x10" });
  ASSERT_EQ(lifecycle->GetEngine(1)->State().mDetectedRegister, "pc");
  lifecycle->OnSessionTerminated(1);

  auto engine = lifecycle->OnSessionStarted(second);
  EXPECT_TRUE(engine->State().IsEmpty());
  second.mCurrentFrame = TopFrame();
  lifecycle->OnStopped(2);
  EXPECT_EQ(second.mEvaluated.size(), 4);
}

TEST_F(SessionLifecycleTest, EnablingSyncsTheCurrentFrame)
{
  Create(false);
  lifecycle->OnSessionStarted(first);
  first.mCurrentFrame = OuterFrame(2, "0xabc <foo>");
  lifecycle->OnStopped(1);
  EXPECT_TRUE(transport.mSent.empty());

  EXPECT_TRUE(lifecycle->Toggle());
  EXPECT_EQ(transport.mSent, std::vector<std::string>{ "0xabc" });
  EXPECT_FALSE(lifecycle->Toggle());
  EXPECT_FALSE(lifecycle->GetEngine(1)->IsEnabled());
}

TEST_F(SessionLifecycleTest, ReenablingAfterFailureForwardsImmediately)
{
  Create(true);
  lifecycle->OnSessionStarted(first);
  first.mCurrentFrame = OuterFrame(1, "0x10");
  lifecycle->OnStopped(1);
  transport.Refuse();
  ASSERT_EQ(timers.Armed(), 1);

  EXPECT_FALSE(lifecycle->Toggle());
  EXPECT_EQ(timers.Armed(), 0);

  EXPECT_TRUE(lifecycle->Toggle());
  EXPECT_EQ(transport.mSent, (std::vector<std::string>{ "0x10", "0x10" }));
  EXPECT_EQ(timers.Armed(), 0);

  transport.Succeed();
  EXPECT_EQ(timers.Armed(), 0);
  timers.Advance(1min);
  EXPECT_EQ(transport.mSent.size(), 2);
}

TEST_F(SessionLifecycleTest, EnablingWithoutSessionIsQuiet)
{
  Create(false);
  EXPECT_TRUE(lifecycle->Toggle());
  EXPECT_TRUE(lifecycle->IsEnabled());
  EXPECT_TRUE(notifier.mMessages.empty());
  EXPECT_TRUE(transport.mSent.empty());
}

TEST_F(SessionLifecycleTest, ManualSyncExplainsWhyNothingHappened)
{
  Create(false);
  lifecycle->SyncCurrentFrame();
  lifecycle->OnSessionStarted(first);
  lifecycle->SyncCurrentFrame();
  first.mCurrentFrame = OuterFrame(4, std::nullopt);
  lifecycle->SyncCurrentFrame();

  EXPECT_EQ(Warnings(),
    (std::vector<std::string>{ "No active DAP session", "No current frame", "Cannot determine frame address" }));
  EXPECT_TRUE(transport.mSent.empty());
}

TEST_F(SessionLifecycleTest, ManualSyncIgnoresTheEnabledFlag)
{
  Create(false);
  lifecycle->OnSessionStarted(first);
  first.mCurrentFrame = OuterFrame(1, "0x400000");
  lifecycle->SyncCurrentFrame();
  EXPECT_EQ(transport.mSent, std::vector<std::string>{ "0x400000" });
}

TEST_F(SessionLifecycleTest, ReportsTheScriptPath)
{
  Create(false);
  EXPECT_EQ(lifecycle->ReportScriptPath(), Path{ "/opt/dapsync/ghidra_start_goto_server.py" });
  ASSERT_EQ(notifier.mMessages.size(), 1);
  EXPECT_EQ(notifier.mMessages[0].first, sync::Severity::Info);
  EXPECT_EQ(notifier.mMessages[0].second, "Ghidra script: /opt/dapsync/ghidra_start_goto_server.py");
}

TEST_F(SessionLifecycleTest, ReplacedConfigurationTakesEffect)
{
  Create(true);
  lifecycle->OnSessionStarted(first);
  first.mCurrentFrame = OuterFrame(1, "0x10");
  lifecycle->SyncCurrentFrame();
  transport.Refuse();
  ASSERT_EQ(timers.Armed(), 1);

  auto config = LifecycleConfiguration(true);
  config.mViewerHost = "ghidra.lan";
  config.mViewerPort = 4768;
  config.mRetryInterval = 250ms;
  lifecycle->ReplaceConfiguration(config);
  EXPECT_EQ(lifecycle->Configuration(), config);
  EXPECT_EQ(timers.Armed(), 0);
  EXPECT_TRUE(lifecycle->IsEnabled());

  lifecycle->SyncCurrentFrame();
  EXPECT_EQ(transport.mEndpoints.back(), (sync::ViewerEndpoint{ .mHost = "ghidra.lan", .mPort = 4768 }));
  transport.Refuse();
  EXPECT_EQ(timers.mLastDelay, 250ms);
  EXPECT_EQ(notifier.Count(sync::Severity::Warning), 2);
}

TEST_F(SessionLifecycleTest, ActiveSessionFallsBackWhenItEnds)
{
  Create(true);
  lifecycle->OnSessionStarted(first);
  lifecycle->OnSessionStarted(second);
  EXPECT_EQ(lifecycle->ActiveEngine()->GetSessionId(), 2);

  first.mCurrentFrame = OuterFrame(1, "0x1");
  lifecycle->OnStopped(1);
  EXPECT_EQ(lifecycle->ActiveEngine()->GetSessionId(), 1);

  lifecycle->OnSessionTerminated(1);
  EXPECT_EQ(lifecycle->ActiveEngine()->GetSessionId(), 2);
  lifecycle->OnSessionTerminated(2);
  EXPECT_EQ(lifecycle->ActiveEngine(), nullptr);
}
