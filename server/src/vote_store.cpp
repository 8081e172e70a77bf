/*
 * 설명: 레저 로드/보정/저장과 투표, 초기화, 지표 조회를 직렬화된 트랜잭션으로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/vote_store_it_test.cpp
 */
#include "voteledger/vote_store.hpp"

#include <algorithm>
#include <set>

#include "voteledger/ledger_error.hpp"

namespace voteledger {
namespace {
std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

const LogoEntry* FindLogo(const std::vector<LogoEntry>& roster, const std::string& id) {
  for (const auto& logo : roster) {
    if (logo.id == id) {
      return &logo;
    }
  }
  return nullptr;
}

ParticipantSnapshot MakeSnapshot(const LogoEntry& logo, const RatingEntry& before, const RatingEntry& after) {
  ParticipantSnapshot snapshot;
  snapshot.id = logo.id;
  snapshot.name = logo.name;
  snapshot.codename = logo.codename;
  snapshot.rating_before = before.rating;
  snapshot.rating_after = after.rating;
  snapshot.wins_before = before.wins;
  snapshot.wins_after = after.wins;
  snapshot.losses_before = before.losses;
  snapshot.losses_after = after.losses;
  snapshot.matches_before = before.matches;
  snapshot.matches_after = after.matches;
  return snapshot;
}

RatingEntry EntryOrDefault(const RatingState& state, const std::string& id) {
  auto it = state.entries.find(id);
  return it == state.entries.end() ? RatingEntry{} : it->second;
}
}  // namespace

std::vector<LeaderboardEntry> BuildLeaderboard(const RatingState& state, const std::vector<LogoEntry>& roster,
                                               std::size_t limit) {
  std::vector<LeaderboardEntry> board;
  for (const auto& [id, entry] : state.entries) {
    const LogoEntry* logo = FindLogo(roster, id);
    if (!logo) {
      continue;
    }
    LeaderboardEntry row;
    row.logo_id = id;
    row.logo_name = logo->name;
    row.logo_codename = logo->codename;
    row.logo_image = logo->image;
    row.rating = entry.rating;
    row.wins = entry.wins;
    row.losses = entry.losses;
    row.matches = entry.matches;
    board.push_back(std::move(row));
  }
  std::sort(board.begin(), board.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
    if (a.rating != b.rating) {
      return a.rating > b.rating;
    }
    return a.logo_id < b.logo_id;
  });
  if (limit > 0 && board.size() > limit) {
    board.resize(limit);
  }
  return board;
}

VoteStore::VoteStore(const LedgerConfig& config, std::shared_ptr<ContestRegistry> registry,
                     std::shared_ptr<LogoCatalog> catalog, std::shared_ptr<BackupManager> backups,
                     std::shared_ptr<AuditLog> audit_log, std::shared_ptr<const Clock> clock,
                     std::shared_ptr<Observability> observability)
    : config_(config),
      data_dir_(config.data_dir),
      engine_(config.history_limit),
      registry_(std::move(registry)),
      catalog_(std::move(catalog)),
      backups_(std::move(backups)),
      audit_log_(std::move(audit_log)),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

VotesFile VoteStore::ReadVotesFile(bool& needs_persist, TransactionMode mode) {
  needs_persist = false;
  const auto path = VotesPath();
  const std::string now_iso = ToIsoString(clock_->NowMillis());

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    VotesFile fresh;
    fresh.updated_at = now_iso;
    return fresh;
  }

  auto decode = [&](const std::string& content, std::string& error) -> std::optional<Parsed<VotesFile>> {
    try {
      return ParseVotesFile(nlohmann::json::parse(content), config_.default_contest_id, now_iso);
    } catch (const nlohmann::json::exception& e) {
      error = e.what();
    } catch (const LedgerException& e) {
      error = e.what();
    }
    return std::nullopt;
  };

  std::string error;
  std::optional<Parsed<VotesFile>> parsed = decode(ReadWholeFile(path), error);
  if (!parsed) {
    if (observability_) {
      observability_->Warn("votes_file_corrupted", "votes 파일이 손상되어 백업 복원을 시도합니다",
                           {{"path", path.string()}, {"error", error}});
    }
    std::optional<std::string> recovered;
    if (mode == TransactionMode::kReadOnly) {
      if (auto latest = backups_->LoadLatestBackup(kVotesBackupPrefix)) {
        recovered = std::move(latest->content);
      }
    } else if (backups_->RestoreLatestBackup(kVotesBackupPrefix, path)) {
      recovered = ReadWholeFile(path);
    }
    if (!recovered) {
      throw LedgerException("votes 파일이 손상되었고 복원 가능한 백업이 없습니다: " + error,
                            error_code::kLedgerCorrupted);
    }
    std::string restore_error;
    parsed = decode(*recovered, restore_error);
    if (!parsed) {
      throw LedgerException("복원한 votes 파일을 해석할 수 없습니다: " + restore_error,
                            error_code::kLedgerCorrupted);
    }
  }

  if (!parsed->rejected.empty() && observability_) {
    nlohmann::json locations = nlohmann::json::array();
    for (const auto& record : parsed->rejected) {
      locations.push_back(record.location + ": " + record.reason);
    }
    observability_->Warn("votes_records_rejected", "votes 파일에서 잘못된 기록을 제외했습니다",
                         {{"rejected", locations}});
  }
  if (parsed->converted) {
    if (observability_) {
      observability_->Warn("votes_file_converted", "구버전 votes 파일을 version 2로 변환합니다",
                           {{"contestId", config_.default_contest_id}});
    }
    needs_persist = true;
  }
  return std::move(parsed->value);
}

void VoteStore::WriteVotesFile(VotesFile file, bool force_backup) {
  file.version = kVotesSchemaVersion;
  file.updated_at = ToIsoString(clock_->NowMillis());

  WriteOptions options;
  options.file_path = VotesPath();
  options.payload = SerializeVotesFile(file);
  options.prefix = kVotesBackupPrefix;
  options.min_interval_ms = config_.backup_min_interval_ms;
  options.max_retained = config_.backup_max_retained;
  options.force_backup = force_backup;
  backups_->WriteWithBackup(options);
}

void VoteStore::AppendEvents(const std::optional<EntriesPrunedEvent>& prune_event, std::vector<AuditEvent>& events) {
  if (prune_event) {
    audit_log_->Append(*prune_event);
    if (observability_) {
      observability_->Warn("ledger_entries_pruned", "로스터에서 빠진 항목을 레저에서 제거했습니다",
                           {{"contestId", prune_event->contest_id},
                            {"removedIds", prune_event->removed_ids},
                            {"droppedHistoryCount", prune_event->dropped_history_count}});
    }
  }
  for (auto& event : events) {
    audit_log_->Append(std::move(event));
  }
  events.clear();
}

EntriesPrunedEvent VoteStore::DescribePrune(const std::string& contest_id, const RatingState& before,
                                            const RatingState& after) const {
  EntriesPrunedEvent event;
  event.contest_id = contest_id;
  for (const auto& entry : before.entries) {
    if (!after.entries.count(entry.first)) {
      event.removed_ids.push_back(entry.first);
    }
  }
  // 항목은 남았지만 이력만 빠진 경우의 상대 id도 기록한다.
  std::set<std::string> removed(event.removed_ids.begin(), event.removed_ids.end());
  for (const auto& match : before.history) {
    for (const auto* id : {&match.winner_id, &match.loser_id}) {
      if (!after.entries.count(*id) && !removed.count(*id)) {
        removed.insert(*id);
        event.removed_ids.push_back(*id);
      }
    }
  }
  event.dropped_history_count = before.history.size() - after.history.size();
  return event;
}

RatingState VoteStore::ExecuteTransaction(const std::string& contest_id,
                                          const std::function<bool(LedgerTransaction&)>& work, TransactionMode mode) {
  std::lock_guard<std::mutex> lock(mutex_);

  LedgerTransaction tx;
  tx.contest_id = registry_->ResolveContestId(contest_id);
  tx.roster = catalog_->ActiveLogos(tx.contest_id);
  const std::vector<std::string> ids = RosterIds(tx.roster);

  bool needs_persist = false;
  VotesFile file = ReadVotesFile(needs_persist, mode);
  auto existing = file.contests.find(tx.contest_id);
  const bool has_ledger = existing != file.contests.end();
  RatingState current = has_ledger ? existing->second.state : RatingState{};

  bool aligned = false;
  if (auto ensured = engine_.EnsureEntries(current, ids)) {
    current = std::move(*ensured);
    aligned = true;
  }
  std::optional<EntriesPrunedEvent> prune_event;
  if (auto pruned = engine_.PruneEntries(current, ids)) {
    prune_event = DescribePrune(tx.contest_id, current, *pruned);
    current = std::move(*pruned);
    aligned = true;
  }
  if (!has_ledger && ids.empty()) {
    aligned = false;
  }

  tx.current = current;
  tx.next = current;
  const bool commit = work(tx);
  if (mode == TransactionMode::kReadOnly) {
    return current;
  }

  RatingState result = commit ? tx.next : current;
  if (!commit && !aligned && !needs_persist) {
    return result;
  }
  if (commit || aligned) {
    file.contests[tx.contest_id] = ContestLedger{result, ToIsoString(clock_->NowMillis())};
  }
  std::vector<AuditEvent> events;
  if (commit) {
    events = std::move(tx.pending_events);
  }
  const bool destructive = (commit && tx.destructive) || prune_event.has_value();
  if (destructive) {
    backups_->SnapshotNow(kVotesBackupPrefix, VotesPath(), config_.backup_max_retained);
    AppendEvents(prune_event, events);
    WriteVotesFile(std::move(file), true);
  } else {
    WriteVotesFile(std::move(file), commit && tx.force_backup);
    AppendEvents(prune_event, events);
  }
  return result;
}

RatingState VoteStore::GetLedger(const std::string& contest_id) {
  return ExecuteTransaction(contest_id, [](LedgerTransaction&) { return false; });
}

RatingState VoteStore::RecordVote(const std::string& winner_id, const std::string& loser_id,
                                  const std::optional<std::string>& voter_hash, const std::string& contest_id) {
  const std::string winner = Trim(winner_id);
  const std::string loser = Trim(loser_id);
  if (winner.empty() || loser.empty()) {
    throw LedgerException("winnerId와 loserId는 필수입니다", error_code::kValidationFailed);
  }
  if (winner == loser) {
    throw LedgerException("같은 로고끼리는 투표할 수 없습니다", error_code::kValidationFailed);
  }

  RatingState next = ExecuteTransaction(contest_id, [&](LedgerTransaction& tx) {
    const LogoEntry* winner_logo = FindLogo(tx.roster, winner);
    const LogoEntry* loser_logo = FindLogo(tx.roster, loser);
    if (!winner_logo || !loser_logo) {
      throw LedgerException("콘테스트에 없는 로고입니다: " + (winner_logo ? loser : winner),
                            error_code::kUnknownEntity);
    }

    const std::int64_t timestamp = clock_->NowMillis();
    tx.next = engine_.ApplyMatch(tx.current, winner, loser, voter_hash, timestamp);

    VoteRecordedEvent event;
    event.contest_id = tx.contest_id;
    event.voter_hash = NormalizeVoterHash(voter_hash);
    event.match_timestamp = timestamp;
    event.match_history_length = tx.next.history.size();
    event.winner = MakeSnapshot(*winner_logo, EntryOrDefault(tx.current, winner), EntryOrDefault(tx.next, winner));
    event.loser = MakeSnapshot(*loser_logo, EntryOrDefault(tx.current, loser), EntryOrDefault(tx.next, loser));
    tx.pending_events.push_back(std::move(event));
    return true;
  });

  if (observability_) {
    observability_->IncrementVotes();
  }
  return next;
}

RatingState VoteStore::ResetContestVotes(const std::string& contest_id, const std::optional<std::string>& initiator,
                                         const std::string& reason) {
  RatingState blank = ExecuteTransaction(contest_id, [&](LedgerTransaction& tx) {
    VotesResetEvent event;
    event.contest_id = tx.contest_id;
    event.initiator = initiator;
    event.reason = reason;
    event.previous_match_count = tx.current.history.size();

    tx.next = engine_.BlankState(RosterIds(tx.roster));
    tx.destructive = true;
    tx.force_backup = true;
    tx.pending_events.push_back(std::move(event));
    return true;
  });

  if (observability_) {
    observability_->IncrementResets();
  }
  return blank;
}

ContestMetrics VoteStore::GetMetrics(const std::string& contest_id) {
  ContestMetrics metrics;
  ExecuteTransaction(contest_id, [&](LedgerTransaction& tx) {
    metrics.contest_id = tx.contest_id;
    metrics.logo_count = tx.roster.size();
    metrics.match_count = tx.current.history.size();
    if (!tx.current.history.empty()) {
      metrics.last_match_at = ToIsoString(tx.current.history.front().timestamp);
    }
    metrics.leaderboard = BuildLeaderboard(tx.current, tx.roster, config_.leaderboard_size);
    return false;
  }, TransactionMode::kReadOnly);
  return metrics;
}

std::optional<Matchup> VoteStore::NextMatchup(const std::string& contest_id, const std::optional<Matchup>& previous) {
  std::optional<Matchup> matchup;
  ExecuteTransaction(contest_id, [&](LedgerTransaction& tx) {
    matchup = engine_.ProduceMatchup(RosterIds(tx.roster), tx.current.entries, previous);
    return false;
  }, TransactionMode::kReadOnly);
  return matchup;
}

}  // namespace voteledger
