/*
 * 설명: JSON 응답 엔벨로프와 레저 결과 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "voteledger/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace voteledger {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

nlohmann::json LeaderboardToJson(const std::vector<LeaderboardEntry>& board) {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& row : board) {
    rows.push_back({{"logoId", row.logo_id},
                    {"logoName", row.logo_name},
                    {"logoCodename", row.logo_codename},
                    {"logoImage", row.logo_image},
                    {"rating", row.rating},
                    {"wins", row.wins},
                    {"losses", row.losses},
                    {"matches", row.matches}});
  }
  return rows;
}

nlohmann::json OptionalIso(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const ContestMetrics& metrics) {
  return {{"contestId", metrics.contest_id},
          {"logoCount", metrics.logo_count},
          {"matchCount", metrics.match_count},
          {"lastMatchAt", OptionalIso(metrics.last_match_at)},
          {"leaderboard", LeaderboardToJson(metrics.leaderboard)}};
}

nlohmann::json ToJson(const RecalculationResult& result) {
  nlohmann::json differences = nlohmann::json::array();
  for (const auto& diff : result.differences) {
    differences.push_back({{"logoId", diff.logo_id},
                           {"ratingBefore", diff.rating_before},
                           {"ratingAfter", diff.rating_after},
                           {"ratingDelta", diff.rating_delta},
                           {"winsBefore", diff.wins_before},
                           {"winsAfter", diff.wins_after},
                           {"winsDelta", diff.wins_delta},
                           {"lossesBefore", diff.losses_before},
                           {"lossesAfter", diff.losses_after},
                           {"lossesDelta", diff.losses_delta},
                           {"matchesBefore", diff.matches_before},
                           {"matchesAfter", diff.matches_after},
                           {"matchesDelta", diff.matches_delta}});
  }
  return {{"contestId", result.contest_id},
          {"dryRun", result.dry_run},
          {"applied", result.applied},
          {"summary",
           {{"totalMatches", result.total_matches},
            {"changedCount", result.differences.size()},
            {"changesDetected", result.changes_detected},
            {"lastMatchAt", OptionalIso(result.last_match_at)}}},
          {"differences", differences},
          {"proposedLeaderboard", LeaderboardToJson(result.proposed_leaderboard)},
          {"invariantViolations", result.invariant_violations},
          {"rejectedEvents", result.rejected_events}};
}

nlohmann::json ToJson(const Matchup& matchup) {
  return {{"primaryId", matchup.primary_id}, {"challengerId", matchup.challenger_id}};
}

}  // namespace voteledger
