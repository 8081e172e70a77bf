/*
 * 설명: 레저 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace voteledger {

inline constexpr const char* kDefaultContestId = "badge-arena";

struct LedgerConfig {
  std::string data_dir{"server/runtime-data"};
  std::string log_level{"info"};
  std::int64_t backup_min_interval_ms{60'000};
  std::size_t backup_max_retained{120};
  std::size_t history_limit{1000};
  std::size_t leaderboard_size{5};
  std::string default_contest_id{kDefaultContestId};
  std::string vote_hash_salt{"ces3-vote-salt-v1"};
  std::size_t worker_threads{2};
};

LedgerConfig LoadConfigFromEnv();

}  // namespace voteledger
