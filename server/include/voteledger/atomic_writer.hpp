/*
 * 설명: JSON 파일을 크래시 안전하게 교체 저장하고, 접두어별 백업 스냅샷의 스로틀링/보존/복원을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/atomic_writer_test.cpp, server/tests/it/vote_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "voteledger/clock.hpp"
#include "voteledger/observability.hpp"

namespace voteledger {

inline constexpr std::int64_t kDefaultBackupMinIntervalMs = 60'000;
inline constexpr std::size_t kDefaultBackupMaxRetained = 120;

// 임시 파일 작성 → fsync → rename → 대상 fsync → 디렉터리 fsync. 실패 시 io_failed 예외.
void AtomicWriteFile(const std::filesystem::path& destination, const std::string& payload,
                     const Observability* observability = nullptr);

std::string ReadWholeFile(const std::filesystem::path& path);

// <epochMillis>-<uuid>.json 또는 2024-01-01T00-00-00-000Z-... 형식에서 시각을 꺼낸다.
std::optional<std::int64_t> ParseBackupTimestamp(const std::string& file_name);

// 프로세스당 하나를 만들어 작성기들에 참조로 넘긴다. 여러 프로세스 사이에서는 공유되지 않는다.
class BackupThrottler {
 public:
  bool ShouldSkip(const std::string& prefix, std::int64_t now_ms, std::int64_t min_interval_ms, bool force) const;
  void Record(const std::string& prefix, std::int64_t now_ms);
  // 아직 기록이 없는 접두어만 디스크의 최신 백업 시각으로 채운다.
  void SeedIfAbsent(const std::string& prefix, std::int64_t newest_on_disk_ms);
  std::optional<std::int64_t> LastBackup(const std::string& prefix) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::int64_t> last_backup_ms_;
};

struct BackupContent {
  std::filesystem::path path;
  std::string content;
};

struct WriteOptions {
  std::filesystem::path file_path;
  std::string payload;
  std::string prefix;
  std::int64_t min_interval_ms{kDefaultBackupMinIntervalMs};
  std::size_t max_retained{kDefaultBackupMaxRetained};
  bool force_backup{false};
};

class BackupManager {
 public:
  BackupManager(std::filesystem::path data_dir, BackupThrottler& throttler, std::shared_ptr<const Clock> clock,
                std::shared_ptr<Observability> observability);

  // 저장 후 백업 경로를 돌려준다. 스로틀로 건너뛰거나 복사에 실패하면 nullopt.
  std::optional<std::filesystem::path> WriteWithBackup(const WriteOptions& options);

  // 파괴적 연산 직전의 사전 이미지. 원본이 없으면 nullopt.
  std::optional<std::filesystem::path> SnapshotNow(const std::string& prefix, const std::filesystem::path& source,
                                                   std::size_t max_retained = kDefaultBackupMaxRetained);

  bool RestoreLatestBackup(const std::string& prefix, const std::filesystem::path& destination);
  // 최신 순으로 JSON으로 읽히는 첫 백업. 파일은 건드리지 않는다.
  std::optional<BackupContent> LoadLatestBackup(const std::string& prefix) const;

  // 최신 순.
  std::vector<std::filesystem::path> ListBackups(const std::string& prefix) const;
  std::filesystem::path BackupDir(const std::string& prefix) const;

 private:
  // 같은 접두어의 백업 이름은 시각이 엄격히 증가한다.
  std::optional<std::filesystem::path> CopyToBackup(const std::string& prefix, const std::filesystem::path& source,
                                                    std::int64_t now_ms);
  void EnforceRetention(const std::string& prefix, std::size_t max_retained) const;

  std::filesystem::path data_dir_;
  BackupThrottler& throttler_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace voteledger
