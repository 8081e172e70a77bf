/*
 * 설명: 레이팅 상태와 votes.json 스키마를 JSON으로 직렬화하고, 손상/구버전 입력을 검증해 거부 목록과 함께 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ledger_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voteledger/rating.hpp"

namespace voteledger {

inline constexpr int kVotesSchemaVersion = 2;

struct ContestLedger {
  RatingState state;
  std::string updated_at;
};

struct VotesFile {
  int version{kVotesSchemaVersion};
  std::map<std::string, ContestLedger> contests;
  std::string updated_at;
};

struct RejectedRecord {
  std::string location;
  std::string reason;
};

template <typename T>
struct Parsed {
  T value;
  std::vector<RejectedRecord> rejected;
  // 구버전 스키마를 변환한 경우 true.
  bool converted{false};
};

void to_json(nlohmann::json& j, const RatingEntry& entry);
void to_json(nlohmann::json& j, const MatchRecord& record);
void to_json(nlohmann::json& j, const RatingState& state);
void to_json(nlohmann::json& j, const ContestLedger& ledger);
void to_json(nlohmann::json& j, const VotesFile& file);

// JSON.stringify(data, null, 2) + 개행과 같은 형태.
std::string SerializeVotesFile(const VotesFile& file);

// 음이 아닌 정수만 받는다. 1.0 같은 정수값 실수는 허용한다.
std::optional<std::uint64_t> CoerceCount(const nlohmann::json& value);

// 숫자 epoch 또는 ISO 문자열을 받는다.
std::optional<std::int64_t> CoerceTimestamp(const nlohmann::json& value);

Parsed<RatingState> ParseRatingState(const nlohmann::json& value, const std::string& location);

// version 2 스키마가 아니면 단일 콘테스트 구버전으로 보고 legacy_contest_id 아래로 옮긴다.
// 객체가 아니면 LedgerException(validation_failed)을 던진다.
Parsed<VotesFile> ParseVotesFile(const nlohmann::json& value, const std::string& legacy_contest_id,
                                 const std::string& fallback_iso);

}  // namespace voteledger
