#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "support/ledger_test_support.hpp"
#include "voteledger/ledger_error.hpp"
#include "voteledger/offline_merger.hpp"

namespace {

voteledger::OfflineMerger MakeMerger(voteledger::MergeOptions options = {}) {
  auto observability = std::make_shared<voteledger::Observability>(voteledger::LogLevel::kError);
  return voteledger::OfflineMerger(std::move(options), std::make_shared<voteledger_test::ManualClock>(),
                                   observability);
}

voteledger::MatchRecord Match(const std::string& winner, const std::string& loser, std::int64_t timestamp) {
  return voteledger::MatchRecord{winner, loser, timestamp, std::nullopt};
}

std::string ExportFile(const std::vector<voteledger::MatchRecord>& newest_first, std::uint64_t matches = 0) {
  nlohmann::json history = nlohmann::json::array();
  for (const auto& match : newest_first) {
    history.push_back(match);
  }
  nlohmann::json entries = nlohmann::json::object();
  entries["alpha"] = voteledger::RatingEntry{1500, 0, 0, matches};
  nlohmann::json doc{{"version", 2},
                     {"updatedAt", "2024-01-01T00:00:00.000Z"},
                     {"contests",
                      {{"badge-arena",
                        {{"updatedAt", "2024-01-01T00:00:00.000Z"},
                         {"state", {{"entries", entries}, {"history", history}}}}}}}};
  return doc.dump(2);
}

TEST(OfflineMergerTest, DeduplicatesMatchesAndRecomputesRatings) {
  voteledger::MergeOptions options;
  options.max_history = 100;
  auto merger = MakeMerger(options);

  voteledger::ContestAggregation aggregation;
  aggregation.matches = {Match("alpha", "beta", 1000), Match("alpha", "beta", 1000), Match("beta", "alpha", 4000)};
  aggregation.latest_updated_at = "2024-01-01T00:00:00.000Z";
  aggregation.inferred_entry_matches = 10;

  auto result = merger.MergeContest("badge-arena", aggregation, {"alpha", "beta"});

  EXPECT_EQ(result.matches_applied, 2u);
  EXPECT_EQ(result.duplicates_skipped, 1u);
  ASSERT_EQ(result.state.history.size(), 2u);
  EXPECT_EQ(result.state.history[0].winner_id, "beta");
  EXPECT_EQ(result.state.history[0].timestamp, 4000);
  EXPECT_EQ(result.state.history[1].winner_id, "alpha");
  EXPECT_EQ(result.state.history[1].timestamp, 1000);

  const auto& alpha = result.state.entries.at("alpha");
  const auto& beta = result.state.entries.at("beta");
  EXPECT_EQ(alpha.matches, 2u);
  EXPECT_EQ(beta.matches, 2u);
  EXPECT_EQ(alpha.wins, 1u);
  EXPECT_EQ(alpha.losses, 1u);
  EXPECT_EQ(beta.wins, 1u);
  EXPECT_EQ(beta.losses, 1u);
  EXPECT_NEAR(alpha.rating, 1498.53, 0.005);
  EXPECT_NEAR(beta.rating, 1501.47, 0.005);

  EXPECT_EQ(result.earliest_timestamp, 1000);
  EXPECT_EQ(result.latest_timestamp, 4000);
  EXPECT_EQ(result.missing_history_estimate, std::optional<std::uint64_t>(8));
  EXPECT_FALSE(result.warnings.empty());
}

TEST(OfflineMergerTest, EqualTimestampsReplayInWinnerOrder) {
  auto merger = MakeMerger();
  voteledger::ContestAggregation aggregation;
  aggregation.matches = {Match("gamma", "alpha", 50), Match("beta", "alpha", 50)};

  auto result = merger.MergeContest("badge-arena", aggregation, {"alpha", "beta", "gamma"});
  ASSERT_EQ(result.state.history.size(), 2u);
  EXPECT_EQ(result.state.history[1].winner_id, "beta");
  EXPECT_EQ(result.state.history[0].winner_id, "gamma");
  EXPECT_FALSE(result.missing_history_estimate.has_value());
}

TEST(OfflineMergerTest, EmptyContestKeepsRosterDefaultsAndWarns) {
  auto merger = MakeMerger();
  auto result = merger.MergeContest("badge-arena", voteledger::ContestAggregation{}, {"alpha", "beta"});
  EXPECT_EQ(result.matches_applied, 0u);
  EXPECT_EQ(result.state.entries.size(), 2u);
  EXPECT_DOUBLE_EQ(result.state.entries.at("alpha").rating, voteledger::kDefaultRating);
  EXPECT_FALSE(result.warnings.empty());
  EXPECT_FALSE(result.earliest_timestamp.has_value());
}

TEST(OfflineMergerTest, NonPositiveMaxHistoryKeepsWholeHistory) {
  voteledger::MergeOptions options;
  options.max_history = 0;
  auto merger = MakeMerger(options);
  voteledger::ContestAggregation aggregation;
  for (int i = 0; i < 1200; ++i) {
    aggregation.matches.push_back(Match(i % 2 ? "alpha" : "beta", i % 2 ? "beta" : "alpha", i));
  }
  auto result = merger.MergeContest("badge-arena", aggregation, {"alpha", "beta"});
  EXPECT_EQ(result.state.history.size(), 1200u);
}

TEST(OfflineMergerTest, AccumulateFiltersContestsAndConvertsLegacyFiles) {
  voteledger::MergeOptions options;
  options.contest_filter = {voteledger::kDefaultContestId};
  auto merger = MakeMerger(options);

  auto current = nlohmann::json::parse(R"({
    "version": 2, "updatedAt": "2024-01-02T00:00:00.000Z",
    "contests": {
      "spring": {"updatedAt": "2024-01-02T00:00:00.000Z", "state": {"entries": {}, "history": [
        {"winnerId": "x", "loserId": "y", "timestamp": 1}]}}
    }
  })");
  auto legacy = nlohmann::json::parse(R"({
    "state": {"entries": {"alpha": {"rating": 1520, "wins": 3, "losses": 2, "matches": 5}},
              "history": [{"winnerId": "alpha", "loserId": "beta", "timestamp": 9, "voterHash": null}]},
    "updatedAt": "2024-01-03T00:00:00.000Z"
  })");

  std::map<std::string, voteledger::ContestAggregation> contests;
  std::vector<std::string> warnings;
  merger.AccumulateFile(current, "a.json", contests, warnings);
  merger.AccumulateFile(legacy, "b.json", contests, warnings);
  merger.AccumulateFile(legacy, "c.json", contests, warnings);

  ASSERT_EQ(contests.size(), 1u);
  const auto& bucket = contests.at(voteledger::kDefaultContestId);
  EXPECT_EQ(bucket.matches.size(), 1u);
  EXPECT_EQ(bucket.duplicate_count, 1u);
  EXPECT_EQ(bucket.inferred_entry_matches, 5u);
  EXPECT_EQ(bucket.latest_updated_at, "2024-01-03T00:00:00.000Z");
}

TEST(OfflineMergerTest, MergingTheSameExportTwiceIsIdempotent) {
  voteledger_test::TempDataDir single;
  voteledger_test::TempDataDir doubled;
  const std::string payload =
      ExportFile({Match("beta", "alpha", 3000), Match("alpha", "beta", 2000), Match("alpha", "beta", 1000)});
  voteledger_test::WriteText(single.Path() / "node-a.json", payload);
  voteledger_test::WriteText(doubled.Path() / "node-a.json", payload);
  voteledger_test::WriteText(doubled.Path() / "node-b.json", payload);

  auto run = [](const std::filesystem::path& input) {
    voteledger::MergeOptions options;
    options.input_dir = input;
    options.logos_path = input / "missing-logos.json";
    options.dry_run = true;
    return MakeMerger(options).Run();
  };
  auto once = run(single.Path());
  auto twice = run(doubled.Path());

  EXPECT_FALSE(once.written);
  EXPECT_EQ(voteledger::SerializeVotesFile(once.merged), voteledger::SerializeVotesFile(twice.merged));
  ASSERT_EQ(twice.summaries.size(), 1u);
  EXPECT_EQ(twice.summaries[0].matches_applied, 3u);
  EXPECT_EQ(twice.summaries[0].duplicates_skipped, 3u);
  EXPECT_FALSE(once.warnings.empty());
}

TEST(MergeArgsTest, ParsesBothFlagFormsAndCollectsWarnings) {
  std::vector<std::string> warnings;
  auto options = voteledger::ParseMergeArgs(
      {"--input=exports", "--contest", "a", "--contest=b", "--max-history", "0", "--dryrun", "--bogus"}, warnings);
  EXPECT_EQ(options.input_dir.string(), "exports");
  EXPECT_EQ(options.contest_filter, (std::set<std::string>{"a", "b"}));
  EXPECT_EQ(options.max_history, std::optional<long long>(0));
  EXPECT_TRUE(options.dry_run);
  EXPECT_EQ(options.output_path.string(), "server/runtime-data/votes.json");
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("--bogus"), std::string::npos);
}

TEST(MergeArgsTest, RejectsMissingInputAndBadHistory) {
  std::vector<std::string> warnings;
  try {
    voteledger::ParseMergeArgs({"--dry-run"}, warnings);
    FAIL() << "예외가 발생해야 합니다";
  } catch (const voteledger::LedgerException& ex) {
    EXPECT_EQ(ex.code, voteledger::error_code::kInvalidArgument);
  }
  EXPECT_THROW(voteledger::ParseMergeArgs({"--input", "x", "--max-history", "ten"}, warnings),
               voteledger::LedgerException);
  EXPECT_THROW(voteledger::ParseMergeArgs({"--input"}, warnings), voteledger::LedgerException);
  EXPECT_NO_THROW(voteledger::ParseMergeArgs({"--help"}, warnings));
}

}  // namespace
