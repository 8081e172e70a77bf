/*
 * 설명: 콘테스트별 레이팅 레저를 로드/보정/저장하고 투표, 초기화, 지표 조회를 감사 로그와 함께 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/vote_store_it_test.cpp, server/tests/e2e/ledger_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voteledger/atomic_writer.hpp"
#include "voteledger/audit_log.hpp"
#include "voteledger/clock.hpp"
#include "voteledger/config.hpp"
#include "voteledger/ledger_codec.hpp"
#include "voteledger/observability.hpp"
#include "voteledger/rating.hpp"
#include "voteledger/roster.hpp"

namespace voteledger {

inline constexpr const char* kVotesFileName = "votes.json";
inline constexpr const char* kVoteEventsFileName = "vote-events.ndjson";
inline constexpr const char* kVotesBackupPrefix = "votes";
inline constexpr const char* kManualResetReason = "manual-reset";

struct LeaderboardEntry {
  std::string logo_id;
  std::string logo_name;
  std::string logo_codename;
  std::string logo_image;
  double rating{kDefaultRating};
  std::uint64_t wins{0};
  std::uint64_t losses{0};
  std::uint64_t matches{0};
};

struct ContestMetrics {
  std::string contest_id;
  std::size_t logo_count{0};
  std::size_t match_count{0};
  std::optional<std::string> last_match_at;
  std::vector<LeaderboardEntry> leaderboard;
};

std::vector<LeaderboardEntry> BuildLeaderboard(const RatingState& state, const std::vector<LogoEntry>& roster,
                                               std::size_t limit);

enum class TransactionMode {
  kReadWrite,
  // 로스터 보정과 손상 복구를 메모리에서만 수행하고 파일과 감사 로그를 건드리지 않는다.
  kReadOnly,
};

// 트랜잭션 작업이 보는 상태. current는 로스터 기준으로 보정된 값이다.
struct LedgerTransaction {
  std::string contest_id;
  std::vector<LogoEntry> roster;
  RatingState current;
  RatingState next;
  bool force_backup{false};
  // true면 저장 전에 사전 이미지 백업을 남긴다.
  bool destructive{false};
  // 커밋 후 잠금을 놓기 전에 순서대로 추가된다.
  std::vector<AuditEvent> pending_events;
};

class VoteStore {
 public:
  VoteStore(const LedgerConfig& config, std::shared_ptr<ContestRegistry> registry,
            std::shared_ptr<LogoCatalog> catalog, std::shared_ptr<BackupManager> backups,
            std::shared_ptr<AuditLog> audit_log, std::shared_ptr<const Clock> clock,
            std::shared_ptr<Observability> observability);

  RatingState GetLedger(const std::string& contest_id);
  RatingState RecordVote(const std::string& winner_id, const std::string& loser_id,
                         const std::optional<std::string>& voter_hash, const std::string& contest_id);
  RatingState ResetContestVotes(const std::string& contest_id, const std::optional<std::string>& initiator = std::nullopt,
                                const std::string& reason = kManualResetReason);
  ContestMetrics GetMetrics(const std::string& contest_id);
  std::optional<Matchup> NextMatchup(const std::string& contest_id, const std::optional<Matchup>& previous);

  // work가 true를 돌려주면 next를 저장하고 pending_events를 감사 로그에 남긴다.
  // 로스터 보정으로 상태가 바뀌었다면 work 결과와 무관하게 보정본을 저장한다.
  // 파괴적 변경은 사전 이미지 백업과 감사 이벤트를 남긴 뒤에 저장한다.
  // kReadOnly에서는 work 결과와 무관하게 보정된 current를 돌려준다.
  RatingState ExecuteTransaction(const std::string& contest_id, const std::function<bool(LedgerTransaction&)>& work,
                                 TransactionMode mode = TransactionMode::kReadWrite);

  const RatingEngine& Engine() const { return engine_; }
  std::filesystem::path VotesPath() const { return data_dir_ / kVotesFileName; }

 private:
  VotesFile ReadVotesFile(bool& needs_persist, TransactionMode mode);
  void WriteVotesFile(VotesFile file, bool force_backup);
  void AppendEvents(const std::optional<EntriesPrunedEvent>& prune_event, std::vector<AuditEvent>& events);
  EntriesPrunedEvent DescribePrune(const std::string& contest_id, const RatingState& before,
                                   const RatingState& after) const;

  LedgerConfig config_;
  std::filesystem::path data_dir_;
  RatingEngine engine_;
  std::shared_ptr<ContestRegistry> registry_;
  std::shared_ptr<LogoCatalog> catalog_;
  std::shared_ptr<BackupManager> backups_;
  std::shared_ptr<AuditLog> audit_log_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<Observability> observability_;
  std::mutex mutex_;
};

}  // namespace voteledger
