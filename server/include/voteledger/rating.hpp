/*
 * 설명: 로고 쌍대 비교 결과로 Elo 레이팅을 계산하고 다음 대결 쌍을 고르는 순수 연산을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_engine_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace voteledger {

inline constexpr double kDefaultRating = 1500.0;
inline constexpr double kKFactor = 32.0;
inline constexpr std::size_t kHistoryLimit = 1000;

struct RatingEntry {
  double rating{kDefaultRating};
  std::uint64_t wins{0};
  std::uint64_t losses{0};
  std::uint64_t matches{0};
};

bool operator==(const RatingEntry& lhs, const RatingEntry& rhs);
bool operator!=(const RatingEntry& lhs, const RatingEntry& rhs);

struct MatchRecord {
  std::string winner_id;
  std::string loser_id;
  std::int64_t timestamp{0};
  std::optional<std::string> voter_hash;
};

bool operator==(const MatchRecord& lhs, const MatchRecord& rhs);
// (timestamp, winner, loser, voter_hash) 순서. 해시 없음은 빈 문자열로 취급한다.
bool MatchOrderLess(const MatchRecord& lhs, const MatchRecord& rhs);

struct RatingState {
  std::map<std::string, RatingEntry> entries;
  // 최신 매치가 앞에 온다.
  std::deque<MatchRecord> history;
};

bool operator==(const RatingState& lhs, const RatingState& rhs);

struct Matchup {
  std::string primary_id;
  std::string challenger_id;
};

std::optional<std::string> NormalizeVoterHash(const std::optional<std::string>& value);

class RatingEngine {
 public:
  // history_limit 0은 이력을 자르지 않는다.
  explicit RatingEngine(std::size_t history_limit = kHistoryLimit);

  double ExpectedScore(double rating_a, double rating_b) const;

  RatingState ApplyMatch(RatingState state, const std::string& winner_id, const std::string& loser_id,
                         const std::optional<std::string>& voter_hash, std::int64_t timestamp) const;

  // 변경이 없으면 nullopt를 돌려주어 호출자가 저장을 건너뛸 수 있게 한다.
  std::optional<RatingState> EnsureEntries(const RatingState& state, const std::vector<std::string>& roster) const;
  std::optional<RatingState> PruneEntries(const RatingState& state, const std::vector<std::string>& roster) const;

  RatingState BlankState(const std::vector<std::string>& roster) const;

  std::optional<Matchup> ProduceMatchup(const std::vector<std::string>& roster,
                                        const std::map<std::string, RatingEntry>& entries,
                                        const std::optional<Matchup>& previous) const;

  std::size_t HistoryLimit() const { return history_limit_; }

 private:
  std::size_t history_limit_;
  const double k_factor_ = kKFactor;
};

}  // namespace voteledger
