/*
 * 설명: 투표 내보내기 파일 병합(중복 제거, 결정적 정렬, 재생)과 voteledger-merge 명령행 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/offline_merger_test.cpp, server/tests/e2e/merge_cli_test.cpp
 */
#include "voteledger/offline_merger.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "voteledger/atomic_writer.hpp"
#include "voteledger/config.hpp"
#include "voteledger/ledger_error.hpp"

namespace voteledger {
namespace fs = std::filesystem;

namespace {
using nlohmann::json;

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

long long ParseMaxHistory(const std::string& raw) {
  if (raw.empty()) {
    throw LedgerException("--max-history에는 숫자 값이 필요합니다", error_code::kInvalidArgument);
  }
  try {
    std::size_t consumed = 0;
    long long value = std::stoll(raw, &consumed);
    if (consumed != raw.size()) {
      throw std::invalid_argument(raw);
    }
    return value;
  } catch (const std::logic_error&) {
    throw LedgerException("--max-history 값이 올바르지 않습니다: " + raw, error_code::kInvalidArgument);
  }
}

bool EndsWithJson(const std::string& name) {
  if (name.size() < 5) {
    return false;
  }
  std::string tail = name.substr(name.size() - 5);
  std::transform(tail.begin(), tail.end(), tail.begin(), [](unsigned char c) { return std::tolower(c); });
  return tail == ".json";
}
}  // namespace

std::string MergeUsage() {
  return "사용법: voteledger-merge --input <directory> [options]\n"
         "\n"
         "옵션:\n"
         "  --input <directory>     병합할 투표 JSON 파일 디렉터리 (필수)\n"
         "  --output <path>         병합 결과 votes.json 경로 (기본값: server/runtime-data/votes.json)\n"
         "  --logos <path>          콘테스트 로스터용 logos.json 경로 (기본값: server/runtime-data/logos.json)\n"
         "  --contest <id>          지정한 콘테스트만 병합 (반복 가능)\n"
         "  --max-history <count>   이력 보존 개수 (기본값: 1000, 0 이하는 전체 보존)\n"
         "  --dry-run               파일을 쓰지 않고 결과만 계산\n"
         "  --verbose               상세 처리 로그 출력\n"
         "  --help                  도움말 출력\n";
}

MergeOptions ParseMergeArgs(const std::vector<std::string>& args, std::vector<std::string>& warnings) {
  MergeOptions options;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string flag = args[i];
    std::optional<std::string> inline_value;
    const auto eq = flag.find('=');
    if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = flag.substr(eq + 1);
      flag = flag.substr(0, eq);
    }
    auto take_value = [&]() -> std::string {
      if (inline_value) {
        return *inline_value;
      }
      if (i + 1 >= args.size()) {
        throw LedgerException(flag + " 옵션에는 값이 필요합니다", error_code::kInvalidArgument);
      }
      return args[++i];
    };

    if (flag == "--input") {
      options.input_dir = take_value();
    } else if (flag == "--output") {
      options.output_path = take_value();
    } else if (flag == "--logos") {
      options.logos_path = take_value();
    } else if (flag == "--contest") {
      const std::string contest = Trim(take_value());
      if (!contest.empty()) {
        options.contest_filter.insert(contest);
      }
    } else if (flag == "--max-history") {
      options.max_history = ParseMaxHistory(take_value());
    } else if (flag == "--dry-run" || flag == "--dryrun") {
      options.dry_run = true;
    } else if (flag == "--verbose") {
      options.verbose = true;
    } else if (flag == "--help" || flag == "-h") {
      options.show_help = true;
    } else {
      warnings.push_back("알 수 없는 인자를 무시합니다: " + args[i]);
    }
  }
  if (options.input_dir.empty() && !options.show_help) {
    throw LedgerException("필수 인자 --input <directory>가 없습니다", error_code::kInvalidArgument);
  }
  return options;
}

std::string MatchKey(const MatchRecord& match) {
  return std::to_string(match.timestamp) + "|" + match.winner_id + "|" + match.loser_id + "|" +
         match.voter_hash.value_or("");
}

OfflineMerger::OfflineMerger(MergeOptions options, std::shared_ptr<const Clock> clock,
                             std::shared_ptr<Observability> observability)
    : options_(std::move(options)), clock_(std::move(clock)), observability_(std::move(observability)) {}

void OfflineMerger::AccumulateFile(const json& document, const std::string& source,
                                   std::map<std::string, ContestAggregation>& contests,
                                   std::vector<std::string>& warnings) const {
  Parsed<VotesFile> parsed = ParseVotesFile(document, kDefaultContestId, ToIsoString(clock_->NowMillis()));
  for (const auto& record : parsed.rejected) {
    warnings.push_back(source + ": " + record.location + " 제외 (" + record.reason + ")");
  }

  for (const auto& [contest_id, ledger] : parsed.value.contests) {
    if (!options_.contest_filter.empty() && !options_.contest_filter.count(contest_id)) {
      continue;
    }
    auto inserted = contests.emplace(contest_id, ContestAggregation{});
    ContestAggregation& bucket = inserted.first->second;
    if (inserted.second || ledger.updated_at > bucket.latest_updated_at) {
      bucket.latest_updated_at = ledger.updated_at;
    }
    for (const auto& entry : ledger.state.entries) {
      bucket.inferred_entry_matches = std::max(bucket.inferred_entry_matches, entry.second.matches);
    }

    std::unordered_set<std::string> seen;
    for (const auto& match : bucket.matches) {
      seen.insert(MatchKey(match));
    }
    for (const auto& match : ledger.state.history) {
      if (!seen.insert(MatchKey(match)).second) {
        ++bucket.duplicate_count;
        continue;
      }
      bucket.matches.push_back(match);
    }
  }
}

std::vector<fs::path> OfflineMerger::ListInputFiles() const {
  std::error_code ec;
  if (!fs::is_directory(options_.input_dir, ec)) {
    throw LedgerException(options_.input_dir.string() + "은(는) 디렉터리가 아닙니다", error_code::kInvalidArgument);
  }
  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(options_.input_dir, ec)) {
    if (entry.is_regular_file(ec) && EndsWithJson(entry.path().filename().string())) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    throw LedgerException("입력 디렉터리를 읽을 수 없습니다: " + ec.message(), error_code::kIoFailed);
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::map<std::string, ContestAggregation> OfflineMerger::LoadVoteFiles(std::vector<std::string>& warnings) const {
  const auto files = ListInputFiles();
  if (files.empty()) {
    throw LedgerException(options_.input_dir.string() + "에 투표 JSON 파일이 없습니다", error_code::kInvalidArgument);
  }

  std::map<std::string, ContestAggregation> contests;
  for (const auto& file : files) {
    try {
      AccumulateFile(json::parse(ReadWholeFile(file)), file.string(), contests, warnings);
      if (options_.verbose && observability_) {
        observability_->Info("merge_file_loaded", "투표 파일을 읽었습니다", {{"path", file.string()}});
      }
    } catch (const json::exception& e) {
      warnings.push_back(file.string() + " 처리 실패: " + e.what());
    } catch (const LedgerException& e) {
      warnings.push_back(file.string() + " 처리 실패: " + e.what());
    }
  }
  return contests;
}

std::map<std::string, std::vector<std::string>> OfflineMerger::LoadContestRosters() const {
  json document;
  try {
    document = json::parse(ReadWholeFile(options_.logos_path));
  } catch (const json::exception& e) {
    throw LedgerException(std::string("로고 파일 파싱 실패: ") + e.what(), error_code::kValidationFailed);
  }
  auto logos = document.is_object() ? document.find("logos") : document.end();
  if (!document.is_object() || logos == document.end() || !logos->is_array()) {
    throw LedgerException("로고 파일 형식이 올바르지 않습니다", error_code::kValidationFailed);
  }

  std::map<std::string, std::vector<std::string>> rosters;
  for (const auto& logo : ParseLogosDocument(document)) {
    if (logo.IsActive()) {
      rosters[logo.contest_id].push_back(logo.id);
    }
  }
  return rosters;
}

MergeSummary OfflineMerger::MergeContest(const std::string& contest_id, const ContestAggregation& aggregation,
                                         const std::vector<std::string>& roster) const {
  std::size_t history_limit = kHistoryLimit;
  if (options_.max_history) {
    history_limit = *options_.max_history > 0 ? static_cast<std::size_t>(*options_.max_history) : 0;
  }
  const RatingEngine engine(history_limit);

  MergeSummary summary;
  summary.contest_id = contest_id;
  summary.duplicates_skipped = aggregation.duplicate_count;
  summary.state = engine.BlankState(roster);

  if (aggregation.matches.empty()) {
    summary.warnings.push_back("콘테스트 " + contest_id + "에 매치가 없습니다");
    return summary;
  }

  std::vector<MatchRecord> sorted = aggregation.matches;
  for (auto& match : sorted) {
    match.voter_hash = NormalizeVoterHash(match.voter_hash);
  }
  std::stable_sort(sorted.begin(), sorted.end(), MatchOrderLess);

  std::unordered_set<std::string> seen;
  std::vector<MatchRecord> unique;
  for (auto& match : sorted) {
    if (!seen.insert(MatchKey(match)).second) {
      ++summary.duplicates_skipped;
      continue;
    }
    unique.push_back(std::move(match));
  }

  for (const auto& match : unique) {
    summary.state = engine.ApplyMatch(std::move(summary.state), match.winner_id, match.loser_id, match.voter_hash,
                                      match.timestamp);
  }
  if (auto ensured = engine.EnsureEntries(summary.state, roster)) {
    summary.state = std::move(*ensured);
  }

  summary.matches_applied = unique.size();
  summary.earliest_timestamp = unique.front().timestamp;
  summary.latest_timestamp = unique.back().timestamp;

  if (aggregation.inferred_entry_matches > unique.size()) {
    summary.missing_history_estimate = aggregation.inferred_entry_matches - unique.size();
    summary.warnings.push_back("콘테스트 " + contest_id + "는 이력 파일이 잘려 " +
                               std::to_string(*summary.missing_history_estimate) +
                               "건의 매치를 잃었을 수 있습니다. 남은 " + std::to_string(unique.size()) +
                               "건으로 레이팅을 다시 계산했습니다.");
  }
  return summary;
}

MergeReport OfflineMerger::Run() {
  MergeReport report;
  if (options_.verbose && observability_) {
    observability_->Info("merge_started", "투표 파일 병합 시작", {{"inputDir", options_.input_dir.string()}});
  }

  auto aggregations = LoadVoteFiles(report.warnings);
  if (aggregations.empty()) {
    throw LedgerException("입력 파일에서 콘테스트를 찾지 못했습니다", error_code::kValidationFailed);
  }

  std::map<std::string, std::vector<std::string>> rosters;
  try {
    rosters = LoadContestRosters();
  } catch (const LedgerException& e) {
    report.warnings.push_back(options_.logos_path.string() + "에서 로고를 읽지 못했습니다: " + e.what() +
                              ". 로스터 정렬 없이 계속합니다.");
  }

  for (const auto& [contest_id, aggregation] : aggregations) {
    auto roster = rosters.find(contest_id);
    MergeSummary summary =
        MergeContest(contest_id, aggregation, roster == rosters.end() ? std::vector<std::string>{} : roster->second);
    report.merged.contests[contest_id] = ContestLedger{summary.state, aggregation.latest_updated_at};
    report.summaries.push_back(std::move(summary));
  }
  report.merged.version = kVotesSchemaVersion;
  report.merged.updated_at = ToIsoString(clock_->NowMillis());

  if (!options_.dry_run) {
    AtomicWriteFile(options_.output_path, SerializeVotesFile(report.merged), observability_.get());
    report.written = true;
  }
  return report;
}

int RunMergeCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  try {
    std::vector<std::string> arg_warnings;
    MergeOptions options = ParseMergeArgs(args, arg_warnings);
    for (const auto& warning : arg_warnings) {
      err << "경고: " << warning << "\n";
    }
    if (options.show_help) {
      out << MergeUsage();
      return 0;
    }

    auto observability = std::make_shared<Observability>(options.verbose ? LogLevel::kInfo : LogLevel::kWarn);
    observability->SetSink(&err);
    OfflineMerger merger(options, std::make_shared<Clock>(), observability);
    MergeReport report = merger.Run();

    for (const auto& summary : report.summaries) {
      out << "콘테스트 " << summary.contest_id << ": 매치 " << summary.matches_applied << "건 적용, 중복 "
          << summary.duplicates_skipped << "건 제외\n";
      if (summary.earliest_timestamp && summary.latest_timestamp) {
        out << "  기간: " << ToIsoString(*summary.earliest_timestamp) << " - "
            << ToIsoString(*summary.latest_timestamp) << "\n";
      }
      for (const auto& warning : summary.warnings) {
        err << "  경고: " << warning << "\n";
      }
    }
    for (const auto& warning : report.warnings) {
      err << "경고: " << warning << "\n";
    }
    if (report.written) {
      out << "병합 결과를 " << options.output_path.string() << "에 저장했습니다\n";
    } else {
      out << "[dry-run] 병합 결과 파일을 쓰지 않았습니다\n";
    }
    return 0;
  } catch (const LedgerException& e) {
    err << "오류(" << e.code << "): " << e.what() << "\n";
  } catch (const std::exception& e) {
    err << "오류: " << e.what() << "\n";
  }
  return 1;
}

}  // namespace voteledger
