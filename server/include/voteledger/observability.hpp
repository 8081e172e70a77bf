/*
 * 설명: 구조화 로그와 레저 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace voteledger {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::optional<std::string> contest_id;
  std::string name;
  std::string message;
  long latency_ms{0};
  nlohmann::json fields = nlohmann::json::object();
};

struct MetricsSnapshot {
  std::uint64_t votes_recorded{0};
  std::uint64_t resets{0};
  std::uint64_t recalculations{0};
  std::uint64_t backups_written{0};
  std::uint64_t backups_skipped{0};
  std::uint64_t restores{0};
  std::uint64_t audit_events{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void SetSink(std::ostream* sink);

  void IncrementVotes() { votes_recorded_.fetch_add(1); }
  void IncrementResets() { resets_.fetch_add(1); }
  void IncrementRecalculations() { recalculations_.fetch_add(1); }
  void IncrementBackupsWritten() { backups_written_.fetch_add(1); }
  void IncrementBackupsSkipped() { backups_skipped_.fetch_add(1); }
  void IncrementRestores() { restores_.fetch_add(1); }
  void IncrementAuditEvents() { audit_events_.fetch_add(1); }
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Info(const std::string& name, const std::string& message, nlohmann::json fields = nlohmann::json::object()) const;
  void Warn(const std::string& name, const std::string& message, nlohmann::json fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<std::uint64_t> votes_recorded_{0};
  std::atomic<std::uint64_t> resets_{0};
  std::atomic<std::uint64_t> recalculations_{0};
  std::atomic<std::uint64_t> backups_written_{0};
  std::atomic<std::uint64_t> backups_skipped_{0};
  std::atomic<std::uint64_t> restores_{0};
  std::atomic<std::uint64_t> audit_events_{0};
};

}  // namespace voteledger
