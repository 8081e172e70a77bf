#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include "voteledger/atomic_writer.hpp"
#include "voteledger/audit_log.hpp"
#include "voteledger/clock.hpp"
#include "voteledger/config.hpp"
#include "voteledger/observability.hpp"
#include "voteledger/reconciler.hpp"
#include "voteledger/roster.hpp"
#include "voteledger/vote_store.hpp"

namespace voteledger_test {

// 2024-01-01T00:00:00.000Z
inline constexpr std::int64_t kBaseTime = 1'704'067'200'000;

class ManualClock : public voteledger::Clock {
 public:
  explicit ManualClock(std::int64_t start = kBaseTime) : now_(start) {}
  std::int64_t NowMillis() const override { return now_.load(); }
  void Advance(std::int64_t ms) { now_.fetch_add(ms); }
  void Set(std::int64_t ms) { now_.store(ms); }

 private:
  std::atomic<std::int64_t> now_;
};

class TempDataDir {
 public:
  TempDataDir() {
    boost::uuids::random_generator generator;
    path_ = std::filesystem::temp_directory_path() / ("voteledger-test-" + boost::uuids::to_string(generator()));
    std::filesystem::create_directories(path_);
  }
  ~TempDataDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDataDir(const TempDataDir&) = delete;
  TempDataDir& operator=(const TempDataDir&) = delete;

  const std::filesystem::path& Path() const { return path_; }

 private:
  std::filesystem::path path_;
};

inline void WriteText(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

struct LogoSeed {
  std::string id;
  std::string contest_id{voteledger::kDefaultContestId};
  bool removed{false};
};

inline void SeedContests(const std::filesystem::path& dir, const std::string& active,
                         const std::vector<std::string>& contest_ids) {
  nlohmann::json contests = nlohmann::json::array();
  for (const auto& id : contest_ids) {
    contests.push_back({{"id", id}, {"slug", id}, {"title", id}, {"status", "active"}, {"votingOpen", true}});
  }
  WriteText(dir / "contests.json",
            nlohmann::json{{"version", 1}, {"activeContestId", active}, {"contests", contests}}.dump(2));
}

inline void SeedLogos(const std::filesystem::path& dir, const std::vector<LogoSeed>& logos) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& logo : logos) {
    nlohmann::json item{{"id", logo.id},
                        {"contestId", logo.contest_id},
                        {"name", "Logo " + logo.id},
                        {"codename", logo.id + "-code"},
                        {"image", "/logos/" + logo.id + ".svg"}};
    item["removedAt"] = logo.removed ? nlohmann::json("2024-01-02T00:00:00.000Z") : nlohmann::json(nullptr);
    list.push_back(item);
  }
  WriteText(dir / "logos.json", nlohmann::json{{"version", 1}, {"logos", list}}.dump(2));
}

// 임시 데이터 디렉터리 위에 VoteStore와 Reconciler를 직접 조립한다.
class StoreHarness {
 public:
  explicit StoreHarness(voteledger::LedgerConfig config = {}) : clock(std::make_shared<ManualClock>()) {
    config.data_dir = dir.Path().string();
    this->config = config;
    observability = std::make_shared<voteledger::Observability>(voteledger::LogLevel::kDebug);
    observability->SetSink(&log_output);
    backups = std::make_shared<voteledger::BackupManager>(dir.Path(), throttler, clock, observability);
    audit_log = std::make_shared<voteledger::AuditLog>(dir.Path() / voteledger::kVoteEventsFileName, clock,
                                                       observability);
    registry = std::make_shared<voteledger::JsonContestRegistry>((dir.Path() / "contests.json").string(),
                                                                 config.default_contest_id, observability);
    catalog = std::make_shared<voteledger::JsonLogoCatalog>((dir.Path() / "logos.json").string(), observability);
    store = std::make_shared<voteledger::VoteStore>(config, registry, catalog, backups, audit_log, clock,
                                                    observability);
    reconciler =
        std::make_shared<voteledger::Reconciler>(store, audit_log, observability, config.leaderboard_size);
  }

  std::filesystem::path VotesPath() const { return dir.Path() / voteledger::kVotesFileName; }

  TempDataDir dir;
  voteledger::LedgerConfig config;
  std::shared_ptr<ManualClock> clock;
  std::ostringstream log_output;
  std::shared_ptr<voteledger::Observability> observability;
  voteledger::BackupThrottler throttler;
  std::shared_ptr<voteledger::BackupManager> backups;
  std::shared_ptr<voteledger::AuditLog> audit_log;
  std::shared_ptr<voteledger::JsonContestRegistry> registry;
  std::shared_ptr<voteledger::JsonLogoCatalog> catalog;
  std::shared_ptr<voteledger::VoteStore> store;
  std::shared_ptr<voteledger::Reconciler> reconciler;
};

}  // namespace voteledger_test
