#include <gtest/gtest.h>

#include "voteledger/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = voteledger::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = voteledger::MakeErrorEnvelope("unknown_entity", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "unknown_entity");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, MetricsShape) {
  voteledger::ContestMetrics metrics;
  metrics.contest_id = "badge-arena";
  metrics.logo_count = 2;
  metrics.leaderboard.push_back({"alpha", "Alpha", "alpha-code", "/logos/alpha.svg", 1516, 1, 0, 1});

  auto json = voteledger::ToJson(metrics);
  EXPECT_EQ(json["contestId"], "badge-arena");
  EXPECT_EQ(json["logoCount"], 2);
  EXPECT_EQ(json["matchCount"], 0);
  EXPECT_TRUE(json["lastMatchAt"].is_null());
  ASSERT_EQ(json["leaderboard"].size(), 1u);
  EXPECT_EQ(json["leaderboard"][0]["logoId"], "alpha");
  EXPECT_EQ(json["leaderboard"][0]["rating"], 1516.0);
}

TEST(JsonEnvelopeTest, RecalculationShape) {
  voteledger::RecalculationResult result;
  result.contest_id = "badge-arena";
  result.dry_run = true;
  result.changes_detected = true;
  result.total_matches = 4;
  result.last_match_at = "2024-01-01T00:00:00.000Z";
  voteledger::RatingDifference diff;
  diff.logo_id = "alpha";
  diff.rating_before = 1600;
  diff.rating_after = 1516;
  diff.rating_delta = -84;
  result.differences.push_back(diff);
  result.invariant_violations.push_back("beta");

  auto json = voteledger::ToJson(result);
  EXPECT_TRUE(json["dryRun"].get<bool>());
  EXPECT_FALSE(json["applied"].get<bool>());
  EXPECT_EQ(json["summary"]["totalMatches"], 4);
  EXPECT_EQ(json["summary"]["changedCount"], 1);
  EXPECT_TRUE(json["summary"]["changesDetected"].get<bool>());
  EXPECT_EQ(json["summary"]["lastMatchAt"], "2024-01-01T00:00:00.000Z");
  EXPECT_EQ(json["differences"][0]["ratingDelta"], -84.0);
  EXPECT_EQ(json["invariantViolations"][0], "beta");
}
