/*
 * 설명: 감사 로그를 처음부터 재생해 레이팅을 다시 계산하고 저장된 스냅샷과의 차이를 보고/교정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/reconciler_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "voteledger/audit_log.hpp"
#include "voteledger/observability.hpp"
#include "voteledger/vote_store.hpp"

namespace voteledger {

struct RatingDifference {
  std::string logo_id;
  double rating_before{0};
  double rating_after{0};
  double rating_delta{0};
  std::uint64_t wins_before{0};
  std::uint64_t wins_after{0};
  std::int64_t wins_delta{0};
  std::uint64_t losses_before{0};
  std::uint64_t losses_after{0};
  std::int64_t losses_delta{0};
  std::uint64_t matches_before{0};
  std::uint64_t matches_after{0};
  std::int64_t matches_delta{0};
};

struct RecalculationResult {
  std::string contest_id;
  bool dry_run{true};
  bool changes_detected{false};
  bool applied{false};
  std::size_t total_matches{0};
  std::optional<std::string> last_match_at;
  std::vector<RatingDifference> differences;
  std::vector<LeaderboardEntry> proposed_leaderboard;
  // matches != wins + losses 인 저장 항목.
  std::vector<std::string> invariant_violations;
  std::size_t rejected_events{0};
};

struct ReplayOutcome {
  RatingState state;
  std::size_t votes_replayed{0};
};

// 이벤트 목록을 빈 상태부터 재생한다. 로스터 보정은 하지 않는다.
ReplayOutcome ReplayEvents(const RatingEngine& engine, const std::vector<AuditEvent>& events);

std::vector<RatingDifference> DiffEntries(const RatingState& persisted, const RatingState& recomputed);

class Reconciler {
 public:
  Reconciler(std::shared_ptr<VoteStore> store, std::shared_ptr<AuditLog> audit_log,
             std::shared_ptr<Observability> observability, std::size_t leaderboard_size);

  RecalculationResult Recalculate(const std::string& contest_id, bool dry_run);

 private:
  std::shared_ptr<VoteStore> store_;
  std::shared_ptr<AuditLog> audit_log_;
  std::shared_ptr<Observability> observability_;
  std::size_t leaderboard_size_;
};

}  // namespace voteledger
