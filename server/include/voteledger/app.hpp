/*
 * 설명: 레저 구성요소를 조립하고, 모든 레저 연산을 단일 strand에서 직렬 실행하는 비동기 진입점을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ledger_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include "voteledger/atomic_writer.hpp"
#include "voteledger/audit_log.hpp"
#include "voteledger/clock.hpp"
#include "voteledger/config.hpp"
#include "voteledger/observability.hpp"
#include "voteledger/reconciler.hpp"
#include "voteledger/roster.hpp"
#include "voteledger/vote_store.hpp"

namespace voteledger {

class LedgerApp {
 public:
  explicit LedgerApp(const LedgerConfig& config, std::shared_ptr<const Clock> clock = std::make_shared<Clock>(),
                     std::shared_ptr<Observability> observability = nullptr);
  ~LedgerApp();

  // Stop 이후 다시 Start할 수 있다.
  void Start();
  void Stop();

  std::future<RatingState> GetLedgerAsync(const std::string& contest_id);
  std::future<RatingState> RecordVoteAsync(const std::string& winner_id, const std::string& loser_id,
                                           const std::optional<std::string>& voter_hash,
                                           const std::string& contest_id);
  // 원시 별칭은 해시로 바꾼 뒤에만 레저에 전달한다.
  std::future<RatingState> RecordVoteForAlias(const std::string& winner_id, const std::string& loser_id,
                                              const std::string& alias, const std::string& contest_id);
  std::future<RatingState> ResetContestVotesAsync(const std::string& contest_id,
                                                  const std::optional<std::string>& initiator);
  std::future<RecalculationResult> RecalculateAsync(const std::string& contest_id, bool dry_run);
  std::future<ContestMetrics> GetMetricsAsync(const std::string& contest_id);
  std::future<std::optional<Matchup>> NextMatchupAsync(const std::string& contest_id,
                                                       const std::optional<Matchup>& previous);

  const LedgerConfig& GetConfig() const { return config_; }
  std::shared_ptr<VoteStore> GetVoteStore() { return vote_store_; }
  std::shared_ptr<Reconciler> GetReconciler() { return reconciler_; }
  std::shared_ptr<AuditLog> GetAuditLog() { return audit_log_; }
  std::shared_ptr<BackupManager> GetBackupManager() { return backup_manager_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  template <typename T>
  std::future<T> Dispatch(const std::string& name, const std::string& contest_id, std::function<T()> work);

  LedgerConfig config_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<Observability> observability_;
  BackupThrottler throttler_;
  std::shared_ptr<BackupManager> backup_manager_;
  std::shared_ptr<AuditLog> audit_log_;
  std::shared_ptr<JsonContestRegistry> registry_;
  std::shared_ptr<JsonLogoCatalog> catalog_;
  std::shared_ptr<VoteStore> vote_store_;
  std::shared_ptr<Reconciler> reconciler_;
  boost::asio::io_context ioc_;
  // Start마다 새로 만들고 Stop에서 놓는다.
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace voteledger
