#include <chrono>
#include <future>
#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "support/ledger_test_support.hpp"
#include "voteledger/api_response.hpp"
#include "voteledger/app.hpp"
#include "voteledger/ledger_error.hpp"
#include "voteledger/voter_hash.hpp"

namespace {

class LedgerFlowTest : public ::testing::Test {
 protected:
  void SetUp() override {
    voteledger_test::SeedContests(dir.Path(), "badge-arena", {"badge-arena"});
    voteledger_test::SeedLogos(dir.Path(), {{"alpha"}, {"beta"}, {"gamma"}});
    voteledger::LedgerConfig config;
    config.data_dir = dir.Path().string();
    config.worker_threads = 4;
    clock = std::make_shared<voteledger_test::ManualClock>();
    auto observability = std::make_shared<voteledger::Observability>(voteledger::LogLevel::kDebug);
    observability->SetSink(&log_output);
    app = std::make_unique<voteledger::LedgerApp>(config, clock, observability);
    app->Start();
  }

  void TearDown() override { app->Stop(); }

  voteledger_test::TempDataDir dir;
  std::shared_ptr<voteledger_test::ManualClock> clock;
  std::ostringstream log_output;
  std::unique_ptr<voteledger::LedgerApp> app;
};

TEST_F(LedgerFlowTest, VoteMetricsRecalculateResetRoundTrip) {
  auto voted = app->RecordVoteForAlias("alpha", "beta", "  Player.One@Example.com", "").get();
  ASSERT_EQ(voted.history.size(), 1u);
  EXPECT_EQ(voted.history.front().voter_hash,
            voteledger::HashAliasForVoting("player.one", app->GetConfig().vote_hash_salt));

  clock->Advance(1000);
  app->RecordVoteAsync("gamma", "alpha", std::nullopt, "badge-arena").get();

  auto metrics = app->GetMetricsAsync("").get();
  EXPECT_EQ(metrics.match_count, 2u);
  EXPECT_EQ(metrics.logo_count, 3u);
  auto metrics_json = voteledger::MakeSuccessEnvelope(voteledger::ToJson(metrics));
  EXPECT_TRUE(metrics_json["success"].get<bool>());
  EXPECT_EQ(metrics_json["data"]["leaderboard"].size(), 3u);

  auto recalculated = app->RecalculateAsync("", true).get();
  EXPECT_FALSE(recalculated.changes_detected);
  EXPECT_EQ(recalculated.total_matches, 2u);

  auto matchup = app->NextMatchupAsync("", std::nullopt).get();
  ASSERT_TRUE(matchup.has_value());
  EXPECT_NE(matchup->primary_id, matchup->challenger_id);

  auto reset = app->ResetContestVotesAsync("", std::string("ops")).get();
  EXPECT_TRUE(reset.history.empty());
  EXPECT_TRUE(app->GetLedgerAsync("").get().history.empty());

  auto snapshot = app->GetObservability()->Snapshot();
  EXPECT_EQ(snapshot.votes_recorded, 2u);
  EXPECT_EQ(snapshot.resets, 1u);
  EXPECT_NE(log_output.str().find("\"eventName\":\"vote_recorded\""), std::string::npos);
}

TEST_F(LedgerFlowTest, ErrorsSurfaceThroughFutures) {
  auto same = app->RecordVoteAsync("alpha", "alpha", std::nullopt, "");
  try {
    same.get();
    FAIL() << "예외가 발생해야 합니다";
  } catch (const voteledger::LedgerException& ex) {
    EXPECT_EQ(ex.code, voteledger::error_code::kValidationFailed);
  }
  EXPECT_THROW(app->GetLedgerAsync("winter").get(), voteledger::LedgerException);
  EXPECT_NE(log_output.str().find("\"code\":\"validation_failed\""), std::string::npos);
}

TEST_F(LedgerFlowTest, ConcurrentSubmissionsAreSerialized) {
  std::vector<std::future<voteledger::RatingState>> pending;
  for (int i = 0; i < 30; ++i) {
    pending.push_back(app->RecordVoteAsync(i % 3 == 0 ? "alpha" : "beta", i % 3 == 0 ? "gamma" : "alpha",
                                           std::nullopt, ""));
  }
  for (auto& future : pending) {
    future.get();
  }
  auto state = app->GetLedgerAsync("").get();
  EXPECT_EQ(state.history.size(), 30u);
  std::uint64_t total_matches = 0;
  for (const auto& entry : state.entries) {
    total_matches += entry.second.matches;
  }
  EXPECT_EQ(total_matches, 60u);
}

TEST_F(LedgerFlowTest, RestartAfterStopServesRequests) {
  app->RecordVoteAsync("alpha", "beta", std::nullopt, "").get();
  app->Stop();
  EXPECT_THROW(app->GetLedgerAsync("").get(), voteledger::LedgerException);

  app->Start();
  auto pending = app->GetLedgerAsync("");
  ASSERT_EQ(pending.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  EXPECT_EQ(pending.get().history.size(), 1u);
}

TEST(LedgerAppLifecycleTest, RejectsWorkBeforeStart) {
  voteledger_test::TempDataDir dir;
  voteledger::LedgerConfig config;
  config.data_dir = dir.Path().string();
  std::ostringstream sink;
  auto observability = std::make_shared<voteledger::Observability>();
  observability->SetSink(&sink);
  voteledger::LedgerApp app(config, std::make_shared<voteledger_test::ManualClock>(), observability);
  EXPECT_THROW(app.GetLedgerAsync("").get(), voteledger::LedgerException);
}

}  // namespace
