/*
 * 설명: votes.json 스키마 직렬화/역직렬화와 구버전 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ledger_codec_test.cpp
 */
#include "voteledger/ledger_codec.hpp"

#include <cmath>

#include "voteledger/clock.hpp"
#include "voteledger/ledger_error.hpp"

namespace voteledger {
namespace {
using nlohmann::json;

std::optional<RatingEntry> CoerceEntry(const json& value, std::string& reason) {
  if (!value.is_object()) {
    reason = "항목이 객체가 아닙니다";
    return std::nullopt;
  }
  auto rating = value.find("rating");
  if (rating == value.end() || !rating->is_number() || !std::isfinite(rating->get<double>())) {
    reason = "rating 값이 숫자가 아닙니다";
    return std::nullopt;
  }
  RatingEntry entry;
  entry.rating = rating->get<double>();
  const std::pair<const char*, std::uint64_t*> counters[] = {
      {"wins", &entry.wins}, {"losses", &entry.losses}, {"matches", &entry.matches}};
  for (const auto& [key, target] : counters) {
    auto it = value.find(key);
    std::optional<std::uint64_t> count = it == value.end() ? std::nullopt : CoerceCount(*it);
    if (!count) {
      reason = std::string(key) + " 값이 올바르지 않습니다";
      return std::nullopt;
    }
    *target = *count;
  }
  return entry;
}

std::optional<MatchRecord> CoerceMatch(const json& value, std::string& reason) {
  if (!value.is_object()) {
    reason = "매치 기록이 객체가 아닙니다";
    return std::nullopt;
  }
  auto winner = value.find("winnerId");
  auto loser = value.find("loserId");
  if (winner == value.end() || !winner->is_string() || winner->get<std::string>().empty() ||
      loser == value.end() || !loser->is_string() || loser->get<std::string>().empty()) {
    reason = "winnerId/loserId가 없습니다";
    return std::nullopt;
  }
  auto ts = value.find("timestamp");
  std::optional<std::int64_t> timestamp = ts == value.end() ? std::nullopt : CoerceTimestamp(*ts);
  if (!timestamp) {
    reason = "timestamp를 해석할 수 없습니다";
    return std::nullopt;
  }
  MatchRecord record;
  record.winner_id = winner->get<std::string>();
  record.loser_id = loser->get<std::string>();
  record.timestamp = *timestamp;
  auto hash = value.find("voterHash");
  if (hash != value.end() && hash->is_string()) {
    record.voter_hash = NormalizeVoterHash(hash->get<std::string>());
  }
  return record;
}

std::string SanitizeIso(const json& value, const std::string& fallback) {
  if (value.is_string() && ParseIsoTimestamp(value.get<std::string>())) {
    return value.get<std::string>();
  }
  return fallback;
}

std::string FieldOr(const json& object, const char* key, const std::string& fallback) {
  auto it = object.find(key);
  return it == object.end() ? fallback : SanitizeIso(*it, fallback);
}
}  // namespace

void to_json(json& j, const RatingEntry& entry) {
  j = json{{"rating", entry.rating}, {"wins", entry.wins}, {"losses", entry.losses}, {"matches", entry.matches}};
}

void to_json(json& j, const MatchRecord& record) {
  j = json{{"winnerId", record.winner_id}, {"loserId", record.loser_id}, {"timestamp", record.timestamp}};
  j["voterHash"] = record.voter_hash ? json(*record.voter_hash) : json(nullptr);
}

void to_json(json& j, const RatingState& state) {
  json entries = json::object();
  for (const auto& [id, entry] : state.entries) {
    entries[id] = entry;
  }
  json history = json::array();
  for (const auto& record : state.history) {
    history.push_back(record);
  }
  j = json{{"entries", entries}, {"history", history}};
}

void to_json(json& j, const ContestLedger& ledger) {
  j = json{{"state", ledger.state}, {"updatedAt", ledger.updated_at}};
}

void to_json(json& j, const VotesFile& file) {
  json contests = json::object();
  for (const auto& [id, ledger] : file.contests) {
    contests[id] = ledger;
  }
  j = json{{"version", file.version}, {"contests", contests}, {"updatedAt", file.updated_at}};
}

std::string SerializeVotesFile(const VotesFile& file) {
  json j = file;
  return j.dump(2) + "\n";
}

std::optional<std::uint64_t> CoerceCount(const json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer()) {
    auto signed_value = value.get<std::int64_t>();
    if (signed_value < 0) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(signed_value);
  }
  if (value.is_number_float()) {
    double d = value.get<double>();
    if (!std::isfinite(d) || d < 0 || std::floor(d) != d) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(d);
  }
  return std::nullopt;
}

std::optional<std::int64_t> CoerceTimestamp(const json& value) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    double d = value.get<double>();
    if (!std::isfinite(d)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(std::llround(d));
  }
  if (value.is_string()) {
    return ParseIsoTimestamp(value.get<std::string>());
  }
  return std::nullopt;
}

Parsed<RatingState> ParseRatingState(const json& value, const std::string& location) {
  Parsed<RatingState> parsed;
  if (!value.is_object()) {
    if (!value.is_null()) {
      parsed.rejected.push_back({location, "상태가 객체가 아닙니다"});
    }
    return parsed;
  }

  auto entries = value.find("entries");
  if (entries != value.end() && entries->is_object()) {
    for (auto it = entries->begin(); it != entries->end(); ++it) {
      std::string reason;
      if (auto entry = CoerceEntry(it.value(), reason)) {
        parsed.value.entries.emplace(it.key(), *entry);
      } else {
        parsed.rejected.push_back({location + ".entries." + it.key(), reason});
      }
    }
  } else if (entries != value.end() && !entries->is_null()) {
    parsed.rejected.push_back({location + ".entries", "entries가 객체가 아닙니다"});
  }

  auto history = value.find("history");
  if (history != value.end() && history->is_array()) {
    for (std::size_t i = 0; i < history->size(); ++i) {
      std::string reason;
      if (auto match = CoerceMatch((*history)[i], reason)) {
        parsed.value.history.push_back(*match);
      } else {
        parsed.rejected.push_back({location + ".history[" + std::to_string(i) + "]", reason});
      }
    }
  } else if (history != value.end() && !history->is_null()) {
    parsed.rejected.push_back({location + ".history", "history가 배열이 아닙니다"});
  }
  return parsed;
}

Parsed<VotesFile> ParseVotesFile(const json& value, const std::string& legacy_contest_id,
                                 const std::string& fallback_iso) {
  if (!value.is_object()) {
    throw LedgerException("votes 파일 최상위가 객체가 아닙니다", error_code::kValidationFailed);
  }

  Parsed<VotesFile> parsed;
  auto version = value.find("version");
  auto contests = value.find("contests");
  const bool current_schema = version != value.end() && version->is_number_integer() &&
                              version->get<int>() == kVotesSchemaVersion && contests != value.end() &&
                              contests->is_object();

  parsed.value.version = kVotesSchemaVersion;
  parsed.value.updated_at = FieldOr(value, "updatedAt", fallback_iso);

  if (current_schema) {
    for (auto it = contests->begin(); it != contests->end(); ++it) {
      const std::string location = "contests." + it.key();
      if (!it.value().is_object()) {
        parsed.rejected.push_back({location, "콘테스트 항목이 객체가 아닙니다"});
        continue;
      }
      auto state_it = it.value().find("state");
      Parsed<RatingState> state =
          ParseRatingState(state_it == it.value().end() ? json() : *state_it, location + ".state");
      parsed.rejected.insert(parsed.rejected.end(), state.rejected.begin(), state.rejected.end());
      parsed.value.contests[it.key()] =
          ContestLedger{std::move(state.value), FieldOr(it.value(), "updatedAt", fallback_iso)};
    }
    return parsed;
  }

  auto legacy_state = value.find("state");
  Parsed<RatingState> state =
      ParseRatingState(legacy_state != value.end() ? *legacy_state : value, "state");
  parsed.rejected = std::move(state.rejected);
  parsed.value.contests[legacy_contest_id] = ContestLedger{std::move(state.value), parsed.value.updated_at};
  parsed.converted = true;
  return parsed;
}

}  // namespace voteledger
