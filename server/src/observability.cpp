/*
 * 설명: 구조화 로그 출력과 레저 메트릭 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "voteledger/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>

namespace voteledger {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel min_level) : min_level_(min_level), sink_(&std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::SetSink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = sink ? sink : &std::cout;
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.votes_recorded = votes_recorded_.load();
  snapshot.resets = resets_.load();
  snapshot.recalculations = recalculations_.load();
  snapshot.backups_written = backups_written_.load();
  snapshot.backups_skipped = backups_skipped_.load();
  snapshot.restores = restores_.load();
  snapshot.audit_events = audit_events_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json = ctx.fields.is_object() ? ctx.fields : nlohmann::json::object();
  log_json["level"] = LevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  if (ctx.contest_id) {
    log_json["contestId"] = *ctx.contest_id;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  (*sink_) << log_json.dump() << std::endl;
}

void Observability::Info(const std::string& name, const std::string& message, nlohmann::json fields) const {
  LogContext ctx;
  ctx.level = LogLevel::kInfo;
  ctx.name = name;
  ctx.message = message;
  ctx.fields = std::move(fields);
  Log(ctx);
}

void Observability::Warn(const std::string& name, const std::string& message, nlohmann::json fields) const {
  LogContext ctx;
  ctx.level = LogLevel::kWarn;
  ctx.name = name;
  ctx.message = message;
  ctx.fields = std::move(fields);
  Log(ctx);
}

}  // namespace voteledger
