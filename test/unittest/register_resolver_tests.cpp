#include <gtest/gtest.h>

#include "sync_fakes.h"
#include <sync/register_resolver.h>
#include <sync/sync_state.h>

using namespace dapsync;
using namespace dapsync::test;

class RegisterResolverTest : public ::testing::Test
{
protected:
  FakeNotifier notifier;
  FakeSessionHost host{ 1 };
  sync::RegisterResolver resolver{ notifier };
  std::shared_ptr<sync::SyncState> state = std::make_shared<sync::SyncState>();
  std::vector<std::string> candidates{ "pc", "rip", "eip", "r15" };
  std::vector<std::string> found;

  void
  Resolve()
  {
    resolver.ResolveProgramCounter(
      host, TopFrame(7), state, candidates, [this](std::string value) { found.push_back(std::move(value)); });
  }
};

TEST_F(RegisterResolverTest, ReadsAllCandidatesConcurrently)
{
  Resolve();
  EXPECT_EQ(host.mEvaluated, (std::vector<std::string>{ "$pc", "$rip", "$eip", "$r15" }));
  for (const auto &evaluation : host.mPending) {
    EXPECT_EQ(evaluation.mFrame.mFrameId, 7);
  }
}

TEST_F(RegisterResolverTest, FirstCompletedCandidateWins)
{
  Resolve();
  EXPECT_TRUE(host.Fail("$pc"));
  EXPECT_TRUE(found.empty());
  // eip completes before rip even though rip comes first in the list.
  EXPECT_TRUE(host.Respond("$eip", std::string{ "0x1000" }));
  EXPECT_TRUE(host.Respond("$rip", std::string{ "0x7fff0001" }));
  EXPECT_TRUE(host.Respond("$r15", std::string{ "0x2" }));

  EXPECT_EQ(found, std::vector<std::string>{ "0x1000" });
  EXPECT_EQ(state->mDetectedRegister, "eip");
  ASSERT_EQ(notifier.mMessages.size(), 1);
  EXPECT_EQ(notifier.mMessages[0].first, sync::Severity::Info);
  EXPECT_EQ(notifier.mMessages[0].second, "Detected PC register: eip");
}

TEST_F(RegisterResolverTest, CachedRegisterIsTheOnlyOneRead)
{
  state->mDetectedRegister = "rip";
  Resolve();
  EXPECT_EQ(host.mEvaluated, std::vector<std::string>{ "$rip" });
  host.Respond("$rip", std::string{ "0x401000 <main>" });
  EXPECT_EQ(found, std::vector<std::string>{ "0x401000 <main>" });
  EXPECT_TRUE(notifier.mMessages.empty());
}

TEST_F(RegisterResolverTest, FailedReadOfCachedRegisterKeepsIt)
{
  state->mDetectedRegister = "rip";
  Resolve();
  host.Fail("$rip");
  EXPECT_TRUE(found.empty());
  EXPECT_EQ(state->mDetectedRegister, "rip");

  Resolve();
  EXPECT_EQ(host.mEvaluated, (std::vector<std::string>{ "$rip", "$rip" }));
}

TEST_F(RegisterResolverTest, NoCandidateResolvesMeansNoCallback)
{
  Resolve();
  for (const auto &name : candidates) {
    host.Fail("$" + name);
  }
  EXPECT_TRUE(found.empty());
  EXPECT_FALSE(state->mDetectedRegister.has_value());
  EXPECT_TRUE(notifier.mMessages.empty());
}

TEST_F(RegisterResolverTest, ResultsFromAnEndedSessionAreDropped)
{
  Resolve();
  ++state->mSessionEpoch;
  host.Respond("$rip", std::string{ "0x10" });
  EXPECT_TRUE(found.empty());
  EXPECT_FALSE(state->mDetectedRegister.has_value());
}

TEST_F(RegisterResolverTest, ResultsAfterStateIsGoneAreDropped)
{
  Resolve();
  state.reset();
  EXPECT_TRUE(host.Respond("$pc", std::string{ "0x10" }));
  EXPECT_TRUE(found.empty());
  EXPECT_TRUE(notifier.mMessages.empty());
}

TEST_F(RegisterResolverTest, OverlappingRacesKeepTheFirstWinner)
{
  Resolve();
  Resolve();
  EXPECT_TRUE(host.Respond("$rip", std::string{ "0x1" }));
  // The first race already has its winner.
  EXPECT_TRUE(host.Respond("$pc", std::string{ "0xdead" }));
  EXPECT_TRUE(host.Respond("$pc", std::string{ "0x2" }));
  // Each race delivers once; the register detected first stays.
  EXPECT_EQ(found, (std::vector<std::string>{ "0x1", "0x2" }));
  EXPECT_EQ(state->mDetectedRegister, "rip");
  EXPECT_EQ(notifier.Count(sync::Severity::Info), 1);
}
