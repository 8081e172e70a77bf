/*
 * 설명: 독립적으로 수집된 투표 내보내기 파일들을 중복 제거 후 결정적 순서로 재생해 하나의 votes.json으로 병합한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/offline_merger_test.cpp, server/tests/e2e/merge_cli_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "voteledger/clock.hpp"
#include "voteledger/ledger_codec.hpp"
#include "voteledger/observability.hpp"
#include "voteledger/rating.hpp"
#include "voteledger/roster.hpp"

namespace voteledger {

struct MergeOptions {
  std::filesystem::path input_dir;
  std::filesystem::path output_path{"server/runtime-data/votes.json"};
  std::filesystem::path logos_path{"server/runtime-data/logos.json"};
  std::set<std::string> contest_filter;
  std::optional<long long> max_history;
  bool dry_run{false};
  bool verbose{false};
  bool show_help{false};
};

// 알 수 없는 인자는 warnings에 남기고 무시한다. 잘못된 값이면 LedgerException(invalid_argument).
MergeOptions ParseMergeArgs(const std::vector<std::string>& args, std::vector<std::string>& warnings);
std::string MergeUsage();

std::string MatchKey(const MatchRecord& match);

struct ContestAggregation {
  std::vector<MatchRecord> matches;
  std::string latest_updated_at;
  std::size_t duplicate_count{0};
  // 원본 파일의 항목들에서 관측한 최대 matches 값.
  std::uint64_t inferred_entry_matches{0};
};

struct MergeSummary {
  std::string contest_id;
  RatingState state;
  std::size_t matches_applied{0};
  std::size_t duplicates_skipped{0};
  std::vector<std::string> warnings;
  std::optional<std::int64_t> earliest_timestamp;
  std::optional<std::int64_t> latest_timestamp;
  std::optional<std::uint64_t> missing_history_estimate;
};

struct MergeReport {
  VotesFile merged;
  std::vector<MergeSummary> summaries;
  std::vector<std::string> warnings;
  bool written{false};
};

class OfflineMerger {
 public:
  OfflineMerger(MergeOptions options, std::shared_ptr<const Clock> clock,
                std::shared_ptr<Observability> observability);

  // contests 맵에 파일 하나의 내용을 누적한다.
  void AccumulateFile(const nlohmann::json& document, const std::string& source,
                      std::map<std::string, ContestAggregation>& contests, std::vector<std::string>& warnings) const;
  std::map<std::string, ContestAggregation> LoadVoteFiles(std::vector<std::string>& warnings) const;

  MergeSummary MergeContest(const std::string& contest_id, const ContestAggregation& aggregation,
                            const std::vector<std::string>& roster) const;

  MergeReport Run();

 private:
  std::vector<std::filesystem::path> ListInputFiles() const;
  std::map<std::string, std::vector<std::string>> LoadContestRosters() const;

  MergeOptions options_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<Observability> observability_;
};

// voteledger-merge 진입점. 성공 0, 실패 1.
int RunMergeCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}  // namespace voteledger
