/*
 * 설명: 환경 변수에서 레저 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "voteledger/config.hpp"

#include <cstdlib>
#include <stdexcept>

#include "voteledger/ledger_error.hpp"

namespace voteledger {

LedgerConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  };
  auto get_number = [&](const char* key, long long def) -> long long {
    std::string raw = get_env(key, std::to_string(def));
    try {
      std::size_t consumed = 0;
      long long value = std::stoll(raw, &consumed);
      if (consumed != raw.size() || value < 0) {
        throw std::invalid_argument(raw);
      }
      return value;
    } catch (const std::logic_error&) {
      throw LedgerException(std::string("설정 값이 올바르지 않습니다: ") + key + "=" + raw,
                            error_code::kInvalidArgument);
    }
  };

  LedgerConfig cfg;
  cfg.data_dir = get_env("DATA_DIR", cfg.data_dir);
  cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);
  cfg.backup_min_interval_ms = get_number("BACKUP_MIN_INTERVAL_MS", cfg.backup_min_interval_ms);
  cfg.backup_max_retained = static_cast<std::size_t>(get_number("BACKUP_MAX_RETAINED", 120));
  cfg.history_limit = static_cast<std::size_t>(get_number("HISTORY_LIMIT", 1000));
  cfg.leaderboard_size = static_cast<std::size_t>(get_number("LEADERBOARD_SIZE", 5));
  cfg.default_contest_id = get_env("DEFAULT_CONTEST_ID", cfg.default_contest_id);
  cfg.vote_hash_salt = get_env("VOTE_HASH_SALT", cfg.vote_hash_salt);
  cfg.worker_threads = static_cast<std::size_t>(get_number("LEDGER_WORKER_THREADS", 2));
  if (cfg.worker_threads == 0) {
    cfg.worker_threads = 1;
  }
  return cfg;
}

}  // namespace voteledger
