/*
 * 설명: 투표/초기화/정리 이벤트를 NDJSON 파일에 추가 전용으로 기록하고 재생용으로 읽어 들인다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/audit_log_test.cpp, server/tests/it/reconciler_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "voteledger/clock.hpp"
#include "voteledger/ledger_codec.hpp"
#include "voteledger/observability.hpp"

namespace voteledger {

inline constexpr const char* kVoteRecordedType = "vote-recorded";
inline constexpr const char* kVotesResetType = "votes-reset";
inline constexpr const char* kEntriesPrunedType = "entries-pruned";

struct ParticipantSnapshot {
  std::string id;
  std::string name;
  std::string codename;
  double rating_before{0};
  double rating_after{0};
  std::uint64_t wins_before{0};
  std::uint64_t wins_after{0};
  std::uint64_t losses_before{0};
  std::uint64_t losses_after{0};
  std::uint64_t matches_before{0};
  std::uint64_t matches_after{0};
};

struct VoteRecordedEvent {
  std::string id;
  std::string occurred_at;
  std::string contest_id;
  std::optional<std::string> voter_hash;
  std::int64_t match_timestamp{0};
  std::size_t match_history_length{0};
  ParticipantSnapshot winner;
  ParticipantSnapshot loser;
};

struct VotesResetEvent {
  std::string id;
  std::string occurred_at;
  std::string contest_id;
  std::optional<std::string> initiator;
  std::string reason;
  std::size_t previous_match_count{0};
};

struct EntriesPrunedEvent {
  std::string id;
  std::string occurred_at;
  std::string contest_id;
  std::vector<std::string> removed_ids;
  std::size_t dropped_history_count{0};
};

using AuditEvent = std::variant<VoteRecordedEvent, VotesResetEvent, EntriesPrunedEvent>;

const std::string& EventContestId(const AuditEvent& event);
const std::string& EventOccurredAt(const AuditEvent& event);

nlohmann::json AuditEventToJson(const AuditEvent& event);
// 알 수 없는 type이나 필수 필드 누락이면 LedgerException(validation_failed).
AuditEvent AuditEventFromJson(const nlohmann::json& value);

struct AuditReadResult {
  std::vector<AuditEvent> events;
  std::vector<RejectedRecord> rejected;
};

class AuditLog {
 public:
  AuditLog(std::filesystem::path log_path, std::shared_ptr<const Clock> clock,
           std::shared_ptr<Observability> observability);

  // id와 occurred_at이 비어 있으면 채운 뒤 한 번의 write 호출로 한 줄을 추가한다.
  AuditEvent Append(AuditEvent event);

  AuditReadResult ReadAll() const;
  // 발생 시각 순(같으면 파일 순)으로 정렬한 해당 콘테스트 이벤트.
  AuditReadResult ReadContest(const std::string& contest_id) const;

  const std::filesystem::path& Path() const { return log_path_; }

 private:
  std::string NewEventId() const;

  std::filesystem::path log_path_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace voteledger
