/*
 * 설명: 감사 이벤트 JSON 변환과 NDJSON 추가/읽기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/audit_log_test.cpp
 */
#include "voteledger/audit_log.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "voteledger/ledger_error.hpp"

namespace voteledger {
namespace {
using nlohmann::json;

json SnapshotToJson(const ParticipantSnapshot& p) {
  return json{{"id", p.id},
              {"name", p.name},
              {"codename", p.codename},
              {"ratingBefore", p.rating_before},
              {"ratingAfter", p.rating_after},
              {"winsBefore", p.wins_before},
              {"winsAfter", p.wins_after},
              {"lossesBefore", p.losses_before},
              {"lossesAfter", p.losses_after},
              {"matchesBefore", p.matches_before},
              {"matchesAfter", p.matches_after}};
}

json NullableString(const std::optional<std::string>& value) { return value ? json(*value) : json(nullptr); }

const json& Require(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    throw LedgerException(std::string("감사 이벤트 필드 누락: ") + key, error_code::kValidationFailed);
  }
  return *it;
}

std::string RequireString(const json& object, const char* key) {
  const json& value = Require(object, key);
  if (!value.is_string()) {
    throw LedgerException(std::string("감사 이벤트 필드 형식 오류: ") + key, error_code::kValidationFailed);
  }
  return value.get<std::string>();
}

template <typename T>
T RequireNumber(const json& object, const char* key) {
  const json& value = Require(object, key);
  if (!value.is_number()) {
    throw LedgerException(std::string("감사 이벤트 숫자 필드 오류: ") + key, error_code::kValidationFailed);
  }
  return value.get<T>();
}

std::uint64_t RequireCount(const json& object, const char* key) {
  auto count = CoerceCount(Require(object, key));
  if (!count) {
    throw LedgerException(std::string("감사 이벤트 개수 필드 오류: ") + key, error_code::kValidationFailed);
  }
  return *count;
}

std::optional<std::string> OptionalString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

ParticipantSnapshot SnapshotFromJson(const json& value) {
  if (!value.is_object()) {
    throw LedgerException("참가자 스냅샷이 객체가 아닙니다", error_code::kValidationFailed);
  }
  ParticipantSnapshot p;
  p.id = RequireString(value, "id");
  p.name = OptionalString(value, "name").value_or("");
  p.codename = OptionalString(value, "codename").value_or("");
  p.rating_before = RequireNumber<double>(value, "ratingBefore");
  p.rating_after = RequireNumber<double>(value, "ratingAfter");
  p.wins_before = RequireCount(value, "winsBefore");
  p.wins_after = RequireCount(value, "winsAfter");
  p.losses_before = RequireCount(value, "lossesBefore");
  p.losses_after = RequireCount(value, "lossesAfter");
  p.matches_before = RequireCount(value, "matchesBefore");
  p.matches_after = RequireCount(value, "matchesAfter");
  return p;
}

struct EventToJson {
  json operator()(const VoteRecordedEvent& e) const {
    return json{{"id", e.id},
                {"type", kVoteRecordedType},
                {"occurredAt", e.occurred_at},
                {"contestId", e.contest_id},
                {"voterHash", NullableString(e.voter_hash)},
                {"matchTimestamp", e.match_timestamp},
                {"matchHistoryLength", e.match_history_length},
                {"winner", SnapshotToJson(e.winner)},
                {"loser", SnapshotToJson(e.loser)}};
  }
  json operator()(const VotesResetEvent& e) const {
    return json{{"id", e.id},
                {"type", kVotesResetType},
                {"occurredAt", e.occurred_at},
                {"contestId", e.contest_id},
                {"initiator", NullableString(e.initiator)},
                {"reason", e.reason},
                {"previousMatchCount", e.previous_match_count}};
  }
  json operator()(const EntriesPrunedEvent& e) const {
    return json{{"id", e.id},
                {"type", kEntriesPrunedType},
                {"occurredAt", e.occurred_at},
                {"contestId", e.contest_id},
                {"removedIds", e.removed_ids},
                {"droppedHistoryCount", e.dropped_history_count}};
  }
};
}  // namespace

const std::string& EventContestId(const AuditEvent& event) {
  return std::visit([](const auto& e) -> const std::string& { return e.contest_id; }, event);
}

const std::string& EventOccurredAt(const AuditEvent& event) {
  return std::visit([](const auto& e) -> const std::string& { return e.occurred_at; }, event);
}

json AuditEventToJson(const AuditEvent& event) { return std::visit(EventToJson{}, event); }

AuditEvent AuditEventFromJson(const json& value) {
  if (!value.is_object()) {
    throw LedgerException("감사 이벤트가 객체가 아닙니다", error_code::kValidationFailed);
  }
  const std::string type = RequireString(value, "type");
  if (type == kVoteRecordedType) {
    VoteRecordedEvent e;
    e.id = RequireString(value, "id");
    e.occurred_at = RequireString(value, "occurredAt");
    e.contest_id = RequireString(value, "contestId");
    e.voter_hash = NormalizeVoterHash(OptionalString(value, "voterHash"));
    auto ts = CoerceTimestamp(Require(value, "matchTimestamp"));
    if (!ts) {
      throw LedgerException("matchTimestamp를 해석할 수 없습니다", error_code::kValidationFailed);
    }
    e.match_timestamp = *ts;
    e.match_history_length = static_cast<std::size_t>(RequireCount(value, "matchHistoryLength"));
    e.winner = SnapshotFromJson(Require(value, "winner"));
    e.loser = SnapshotFromJson(Require(value, "loser"));
    return e;
  }
  if (type == kVotesResetType) {
    VotesResetEvent e;
    e.id = RequireString(value, "id");
    e.occurred_at = RequireString(value, "occurredAt");
    e.contest_id = RequireString(value, "contestId");
    e.initiator = OptionalString(value, "initiator");
    e.reason = OptionalString(value, "reason").value_or("");
    e.previous_match_count = static_cast<std::size_t>(RequireCount(value, "previousMatchCount"));
    return e;
  }
  if (type == kEntriesPrunedType) {
    EntriesPrunedEvent e;
    e.id = RequireString(value, "id");
    e.occurred_at = RequireString(value, "occurredAt");
    e.contest_id = RequireString(value, "contestId");
    const json& removed = Require(value, "removedIds");
    if (!removed.is_array()) {
      throw LedgerException("removedIds가 배열이 아닙니다", error_code::kValidationFailed);
    }
    for (const auto& id : removed) {
      if (id.is_string()) {
        e.removed_ids.push_back(id.get<std::string>());
      }
    }
    e.dropped_history_count = static_cast<std::size_t>(RequireCount(value, "droppedHistoryCount"));
    return e;
  }
  throw LedgerException("알 수 없는 감사 이벤트 type: " + type, error_code::kValidationFailed);
}

AuditLog::AuditLog(std::filesystem::path log_path, std::shared_ptr<const Clock> clock,
                   std::shared_ptr<Observability> observability)
    : log_path_(std::move(log_path)), clock_(std::move(clock)), observability_(std::move(observability)) {}

std::string AuditLog::NewEventId() const {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

AuditEvent AuditLog::Append(AuditEvent event) {
  std::visit(
      [this](auto& e) {
        if (e.id.empty()) {
          e.id = NewEventId();
        }
        if (e.occurred_at.empty()) {
          e.occurred_at = ToIsoString(clock_->NowMillis());
        }
      },
      event);

  const std::string line = AuditEventToJson(event).dump() + "\n";

  std::error_code ec;
  if (log_path_.has_parent_path()) {
    std::filesystem::create_directories(log_path_.parent_path(), ec);
  }
  const int fd = ::open(log_path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw LedgerException("감사 로그 열기 실패: " + log_path_.string() + " (" + std::strerror(errno) + ")",
                          error_code::kIoFailed);
  }
  ssize_t written = 0;
  do {
    written = ::write(fd, line.data(), line.size());
  } while (written < 0 && errno == EINTR);
  const int write_err = errno;
  const bool complete = written == static_cast<ssize_t>(line.size());
  const int sync_rc = complete ? ::fdatasync(fd) : 0;
  ::close(fd);
  if (!complete) {
    throw LedgerException("감사 로그 추가 실패: " + log_path_.string() + " (" +
                              (written < 0 ? std::strerror(write_err) : "부분 쓰기") + ")",
                          error_code::kIoFailed);
  }
  if (sync_rc != 0) {
    throw LedgerException("감사 로그 fsync 실패: " + log_path_.string(), error_code::kIoFailed);
  }

  if (observability_) {
    observability_->IncrementAuditEvents();
  }
  return event;
}

AuditReadResult AuditLog::ReadAll() const {
  AuditReadResult result;
  std::error_code ec;
  if (!std::filesystem::exists(log_path_, ec)) {
    return result;
  }
  std::ifstream in(log_path_, std::ios::binary);
  if (!in) {
    throw LedgerException("감사 로그를 열 수 없습니다: " + log_path_.string(), error_code::kIoFailed);
  }
  const std::string file_name = log_path_.filename().string();
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    const std::string location = file_name + ":" + std::to_string(line_no);
    try {
      result.events.push_back(AuditEventFromJson(json::parse(line)));
    } catch (const json::exception& e) {
      result.rejected.push_back({location, e.what()});
    } catch (const LedgerException& e) {
      result.rejected.push_back({location, e.what()});
    }
  }
  if (!result.rejected.empty() && observability_) {
    observability_->Warn("audit_lines_rejected", "해석할 수 없는 감사 로그 줄이 있습니다",
                         {{"count", result.rejected.size()}});
  }
  return result;
}

AuditReadResult AuditLog::ReadContest(const std::string& contest_id) const {
  AuditReadResult all = ReadAll();
  AuditReadResult result;
  result.rejected = std::move(all.rejected);

  std::vector<std::pair<std::int64_t, AuditEvent>> keyed;
  for (auto& event : all.events) {
    if (EventContestId(event) != contest_id) {
      continue;
    }
    const std::int64_t key = ParseIsoTimestamp(EventOccurredAt(event)).value_or(0);
    keyed.emplace_back(key, std::move(event));
  }
  std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
  for (auto& item : keyed) {
    result.events.push_back(std::move(item.second));
  }
  return result;
}

}  // namespace voteledger
