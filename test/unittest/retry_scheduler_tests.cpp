#include <gtest/gtest.h>

#include "sync_fakes.h"
#include <sync/retry_scheduler.h>
#include <sync/sync_state.h>

using namespace dapsync;
using namespace dapsync::test;
using namespace std::chrono_literals;

class RetrySchedulerTest : public ::testing::Test
{
protected:
  FakeTimerService timers;
  sync::SyncState state{ .mEnabled = true };
  std::vector<std::pair<std::string, u64>> attempts;
  std::unique_ptr<sync::RetryScheduler> retry = std::make_unique<sync::RetryScheduler>(
    timers, state, 3000ms, [this](std::string address, u64 sequence) { attempts.emplace_back(address, sequence); });
};

TEST_F(RetrySchedulerTest, AtMostOneTimerIsArmed)
{
  retry->ScheduleRetry("0x1", 1);
  retry->ScheduleRetry("0x2", 2);
  retry->ScheduleRetry("0x3", 3);
  EXPECT_EQ(timers.Armed(), 1);
  EXPECT_TRUE(retry->IsArmed());
  EXPECT_EQ(timers.mLastDelay, 3000ms);

  timers.Advance(3000ms);
  EXPECT_EQ(attempts, (std::vector<std::pair<std::string, u64>>{ { "0x3", 3 } }));
  EXPECT_FALSE(retry->IsArmed());
}

TEST_F(RetrySchedulerTest, FiresWithTheAddressPendingAtFireTime)
{
  retry->ScheduleRetry("0x1", 1);
  timers.Advance(1000ms);
  retry->Supersede("0x9", 4);
  EXPECT_EQ(state.mPendingAddress, "0x9");
  EXPECT_EQ(timers.Armed(), 1);

  timers.Advance(2000ms);
  EXPECT_EQ(attempts, (std::vector<std::pair<std::string, u64>>{ { "0x9", 4 } }));
}

TEST_F(RetrySchedulerTest, SupersedeIgnoresOlderOrNothingPending)
{
  retry->Supersede("0x5", 5);
  EXPECT_FALSE(state.mPendingAddress.has_value());

  retry->ScheduleRetry("0x7", 7);
  retry->Supersede("0x6", 6);
  EXPECT_EQ(state.mPendingAddress, "0x7");
  EXPECT_EQ(state.mPendingSequence, 7);
}

TEST_F(RetrySchedulerTest, DisabledWhenFiringMeansNoAttempt)
{
  retry->ScheduleRetry("0x1", 1);
  state.mEnabled = false;
  timers.Advance(3000ms);
  EXPECT_TRUE(attempts.empty());
  EXPECT_FALSE(retry->IsArmed());
}

TEST_F(RetrySchedulerTest, DiscardCancelsTimerAndPendingAddress)
{
  retry->ScheduleRetry("0x1", 1);
  retry->Discard();
  EXPECT_EQ(timers.Armed(), 0);
  EXPECT_FALSE(state.mPendingAddress.has_value());
  EXPECT_FALSE(state.mPendingRetryHandle.has_value());
  timers.Advance(10s);
  EXPECT_TRUE(attempts.empty());
}

TEST_F(RetrySchedulerTest, DestructionCancelsTimer)
{
  retry->ScheduleRetry("0x1", 1);
  retry.reset();
  EXPECT_EQ(timers.Armed(), 0);
  EXPECT_EQ(timers.Advance(10s), 0);
}

TEST_F(RetrySchedulerTest, EnsureArmedOnlyArmsWhenNeeded)
{
  retry->EnsureArmed();
  EXPECT_EQ(timers.mScheduledCount, 0);

  retry->ScheduleRetry("0x1", 1);
  retry->EnsureArmed();
  EXPECT_EQ(timers.mScheduledCount, 1);

  // Fired while disabled, address still pending and no timer.
  state.mEnabled = false;
  timers.Advance(3000ms);
  state.mEnabled = true;
  retry->EnsureArmed();
  EXPECT_EQ(timers.mScheduledCount, 2);
  timers.Advance(3000ms);
  EXPECT_EQ(attempts.size(), 1);
}

TEST_F(RetrySchedulerTest, NewIntervalAppliesToNextTimer)
{
  retry->SetInterval(500ms);
  retry->ScheduleRetry("0x1", 1);
  EXPECT_EQ(timers.mLastDelay, 500ms);
  timers.Advance(499ms);
  EXPECT_TRUE(attempts.empty());
  timers.Advance(1ms);
  EXPECT_EQ(attempts.size(), 1);
}
