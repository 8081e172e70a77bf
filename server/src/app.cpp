/*
 * 설명: 레저 구성요소 조립과 strand 기반 직렬 실행 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ledger_flow_test.cpp
 */
#include "voteledger/app.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>

#include "voteledger/ledger_error.hpp"
#include "voteledger/voter_hash.hpp"

namespace voteledger {

LedgerApp::LedgerApp(const LedgerConfig& config, std::shared_ptr<const Clock> clock,
                     std::shared_ptr<Observability> observability)
    : config_(config),
      clock_(std::move(clock)),
      observability_(observability ? std::move(observability)
                                   : std::make_shared<Observability>(ParseLogLevel(config.log_level))),
      ioc_(static_cast<int>(config.worker_threads)),
      strand_(boost::asio::make_strand(ioc_)) {
  const std::filesystem::path data_dir(config_.data_dir);
  backup_manager_ = std::make_shared<BackupManager>(data_dir, throttler_, clock_, observability_);
  audit_log_ = std::make_shared<AuditLog>(data_dir / kVoteEventsFileName, clock_, observability_);
  registry_ = std::make_shared<JsonContestRegistry>((data_dir / "contests.json").string(),
                                                    config_.default_contest_id, observability_);
  catalog_ = std::make_shared<JsonLogoCatalog>((data_dir / "logos.json").string(), observability_);
  vote_store_ = std::make_shared<VoteStore>(config_, registry_, catalog_, backup_manager_, audit_log_, clock_,
                                            observability_);
  reconciler_ = std::make_shared<Reconciler>(vote_store_, audit_log_, observability_, config_.leaderboard_size);
}

LedgerApp::~LedgerApp() { Stop(); }

void LedgerApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  ioc_.restart();
  work_guard_.emplace(ioc_.get_executor());
  const std::size_t thread_count = std::max<std::size_t>(1, config_.worker_threads);
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
  observability_->Info("ledger_app_started", "레저 앱 시작",
                       {{"dataDir", config_.data_dir}, {"workers", thread_count}});
}

void LedgerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // 대기 중인 작업을 모두 처리한 뒤 워커가 끝난다.
  work_guard_.reset();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Info("ledger_app_stopped", "레저 앱 종료");
}

template <typename T>
std::future<T> LedgerApp::Dispatch(const std::string& name, const std::string& contest_id, std::function<T()> work) {
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();
  if (!running_) {
    promise->set_exception(
        std::make_exception_ptr(LedgerException("레저 앱이 실행 중이 아닙니다", error_code::kInvalidArgument)));
    return future;
  }

  std::string trace_id = observability_->NextTraceId();
  boost::asio::post(strand_, [this, promise, work = std::move(work), name, contest_id, trace_id]() {
    const auto started = std::chrono::steady_clock::now();
    LogContext ctx;
    ctx.trace_id = trace_id;
    ctx.name = name;
    if (!contest_id.empty()) {
      ctx.contest_id = contest_id;
    }
    try {
      promise->set_value(work());
      ctx.level = LogLevel::kInfo;
      ctx.message = "처리 완료";
    } catch (const LedgerException& ex) {
      ctx.level = LogLevel::kWarn;
      ctx.message = ex.what();
      ctx.fields["code"] = ex.code;
      promise->set_exception(std::current_exception());
    } catch (const std::exception& ex) {
      ctx.level = LogLevel::kError;
      ctx.message = ex.what();
      promise->set_exception(std::current_exception());
    }
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    observability_->Log(ctx);
  });
  return future;
}

std::future<RatingState> LedgerApp::GetLedgerAsync(const std::string& contest_id) {
  return Dispatch<RatingState>("ledger_get", contest_id,
                               [this, contest_id]() { return vote_store_->GetLedger(contest_id); });
}

std::future<RatingState> LedgerApp::RecordVoteAsync(const std::string& winner_id, const std::string& loser_id,
                                                    const std::optional<std::string>& voter_hash,
                                                    const std::string& contest_id) {
  return Dispatch<RatingState>("vote_recorded", contest_id, [this, winner_id, loser_id, voter_hash, contest_id]() {
    return vote_store_->RecordVote(winner_id, loser_id, voter_hash, contest_id);
  });
}

std::future<RatingState> LedgerApp::RecordVoteForAlias(const std::string& winner_id, const std::string& loser_id,
                                                       const std::string& alias, const std::string& contest_id) {
  return RecordVoteAsync(winner_id, loser_id, HashAliasForVoting(alias, config_.vote_hash_salt), contest_id);
}

std::future<RatingState> LedgerApp::ResetContestVotesAsync(const std::string& contest_id,
                                                           const std::optional<std::string>& initiator) {
  return Dispatch<RatingState>("votes_reset", contest_id, [this, contest_id, initiator]() {
    return vote_store_->ResetContestVotes(contest_id, initiator);
  });
}

std::future<RecalculationResult> LedgerApp::RecalculateAsync(const std::string& contest_id, bool dry_run) {
  return Dispatch<RecalculationResult>("ledger_recalculate", contest_id, [this, contest_id, dry_run]() {
    return reconciler_->Recalculate(contest_id, dry_run);
  });
}

std::future<ContestMetrics> LedgerApp::GetMetricsAsync(const std::string& contest_id) {
  return Dispatch<ContestMetrics>("metrics_get", contest_id,
                                  [this, contest_id]() { return vote_store_->GetMetrics(contest_id); });
}

std::future<std::optional<Matchup>> LedgerApp::NextMatchupAsync(const std::string& contest_id,
                                                                const std::optional<Matchup>& previous) {
  return Dispatch<std::optional<Matchup>>("matchup_next", contest_id, [this, contest_id, previous]() {
    return vote_store_->NextMatchup(contest_id, previous);
  });
}

}  // namespace voteledger
