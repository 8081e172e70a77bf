/*
 * 설명: 감사 로그 재생 기반 레이팅 재계산과 스냅샷 차이 보고를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/reconciler_it_test.cpp
 */
#include "voteledger/reconciler.hpp"

#include <chrono>
#include <cmath>
#include <set>
#include <type_traits>

namespace voteledger {
namespace {
constexpr double kRatingTolerance = 1e-9;

std::int64_t SignedDelta(std::uint64_t before, std::uint64_t after) {
  return static_cast<std::int64_t>(after) - static_cast<std::int64_t>(before);
}
}  // namespace

ReplayOutcome ReplayEvents(const RatingEngine& engine, const std::vector<AuditEvent>& events) {
  ReplayOutcome outcome;
  for (const auto& event : events) {
    std::visit(
        [&](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, VoteRecordedEvent>) {
            outcome.state = engine.ApplyMatch(std::move(outcome.state), e.winner.id, e.loser.id, e.voter_hash,
                                              e.match_timestamp);
            ++outcome.votes_replayed;
          } else if constexpr (std::is_same_v<T, VotesResetEvent>) {
            outcome.state = RatingState{};
            outcome.votes_replayed = 0;
          } else if constexpr (std::is_same_v<T, EntriesPrunedEvent>) {
            const std::set<std::string> removed(e.removed_ids.begin(), e.removed_ids.end());
            for (const auto& id : removed) {
              outcome.state.entries.erase(id);
            }
            std::deque<MatchRecord> kept;
            for (auto& match : outcome.state.history) {
              if (!removed.count(match.winner_id) && !removed.count(match.loser_id)) {
                kept.push_back(std::move(match));
              }
            }
            outcome.state.history = std::move(kept);
          }
        },
        event);
  }
  return outcome;
}

std::vector<RatingDifference> DiffEntries(const RatingState& persisted, const RatingState& recomputed) {
  std::set<std::string> ids;
  for (const auto& entry : persisted.entries) {
    ids.insert(entry.first);
  }
  for (const auto& entry : recomputed.entries) {
    ids.insert(entry.first);
  }

  std::vector<RatingDifference> differences;
  for (const auto& id : ids) {
    auto before_it = persisted.entries.find(id);
    auto after_it = recomputed.entries.find(id);
    const RatingEntry before = before_it == persisted.entries.end() ? RatingEntry{} : before_it->second;
    const RatingEntry after = after_it == recomputed.entries.end() ? RatingEntry{} : after_it->second;

    RatingDifference diff;
    diff.logo_id = id;
    diff.rating_before = before.rating;
    diff.rating_after = after.rating;
    diff.rating_delta = after.rating - before.rating;
    diff.wins_before = before.wins;
    diff.wins_after = after.wins;
    diff.wins_delta = SignedDelta(before.wins, after.wins);
    diff.losses_before = before.losses;
    diff.losses_after = after.losses;
    diff.losses_delta = SignedDelta(before.losses, after.losses);
    diff.matches_before = before.matches;
    diff.matches_after = after.matches;
    diff.matches_delta = SignedDelta(before.matches, after.matches);

    const bool rating_changed = std::fabs(diff.rating_delta) > kRatingTolerance;
    const bool presence_changed = (before_it == persisted.entries.end()) != (after_it == recomputed.entries.end());
    if (rating_changed || presence_changed || diff.wins_delta != 0 || diff.losses_delta != 0 ||
        diff.matches_delta != 0) {
      differences.push_back(diff);
    }
  }
  return differences;
}

Reconciler::Reconciler(std::shared_ptr<VoteStore> store, std::shared_ptr<AuditLog> audit_log,
                       std::shared_ptr<Observability> observability, std::size_t leaderboard_size)
    : store_(std::move(store)),
      audit_log_(std::move(audit_log)),
      observability_(std::move(observability)),
      leaderboard_size_(leaderboard_size) {}

RecalculationResult Reconciler::Recalculate(const std::string& contest_id, bool dry_run) {
  auto started = std::chrono::steady_clock::now();
  RecalculationResult result;
  result.dry_run = dry_run;

  store_->ExecuteTransaction(contest_id, [&](LedgerTransaction& tx) {
    result.contest_id = tx.contest_id;
    AuditReadResult read = audit_log_->ReadContest(tx.contest_id);
    result.rejected_events = read.rejected.size();

    const RatingEngine& engine = store_->Engine();
    ReplayOutcome replay = ReplayEvents(engine, read.events);
    const std::vector<std::string> ids = RosterIds(tx.roster);
    RatingState recomputed = std::move(replay.state);
    if (auto ensured = engine.EnsureEntries(recomputed, ids)) {
      recomputed = std::move(*ensured);
    }
    if (auto pruned = engine.PruneEntries(recomputed, ids)) {
      recomputed = std::move(*pruned);
    }

    result.total_matches = replay.votes_replayed;
    if (!recomputed.history.empty()) {
      result.last_match_at = ToIsoString(recomputed.history.front().timestamp);
    }
    for (const auto& [id, entry] : tx.current.entries) {
      if (entry.matches != entry.wins + entry.losses) {
        result.invariant_violations.push_back(id);
      }
    }
    result.differences = DiffEntries(tx.current, recomputed);
    result.changes_detected = !result.differences.empty();
    result.proposed_leaderboard = BuildLeaderboard(recomputed, tx.roster, leaderboard_size_);

    if (dry_run || !result.changes_detected) {
      return false;
    }
    tx.next = std::move(recomputed);
    tx.destructive = true;
    tx.force_backup = true;
    result.applied = true;
    return true;
  }, dry_run ? TransactionMode::kReadOnly : TransactionMode::kReadWrite);

  if (observability_) {
    observability_->IncrementRecalculations();
    LogContext ctx;
    ctx.level = result.changes_detected ? LogLevel::kWarn : LogLevel::kInfo;
    ctx.contest_id = result.contest_id;
    ctx.name = "ledger_recalculated";
    ctx.message = result.changes_detected ? "재생 결과와 저장 스냅샷이 다릅니다" : "레이팅이 감사 로그와 일치합니다";
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    ctx.fields = {{"dryRun", dry_run},
                  {"applied", result.applied},
                  {"totalMatches", result.total_matches},
                  {"changedCount", result.differences.size()},
                  {"invariantViolations", result.invariant_violations.size()}};
    observability_->Log(ctx);
  }
  return result;
}

}  // namespace voteledger
