/*
 * 설명: POSIX fsync/rename 기반 원자적 파일 교체와 백업 스로틀링/보존/복원을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/atomic_writer_test.cpp
 */
#include "voteledger/atomic_writer.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include "voteledger/ledger_error.hpp"

namespace voteledger {
namespace fs = std::filesystem;

namespace {
constexpr const char* kBackupRoot = "backups";

std::string NewUuid() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

std::string ErrnoMessage(const std::string& what, const fs::path& path, int err) {
  return what + " 실패: " + path.string() + " (" + std::strerror(err) + ")";
}

void WriteAll(int fd, const std::string& payload, const fs::path& path) {
  const char* data = payload.data();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw LedgerException(ErrnoMessage("파일 쓰기", path, errno), error_code::kIoFailed);
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }
}

void FsyncFile(const fs::path& path) {
  const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    throw LedgerException(ErrnoMessage("fsync 대상 열기", path, errno), error_code::kIoFailed);
  }
  const int rc = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    throw LedgerException(ErrnoMessage("fsync", path, err), error_code::kIoFailed);
  }
}

// 디렉터리 fsync 실패는 치명적이지 않다.
bool FsyncDirectory(const fs::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  const int rc = ::fsync(fd);
  ::close(fd);
  return rc == 0;
}

bool AllDigits(const std::string& text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// 2024-01-01T00-00-00-000Z 형태인지 확인한다.
bool MatchesIsoStamp(const std::string& base) {
  static const std::string kPattern = "dddd-dd-ddTdd-dd-dd-dddZ";
  if (base.size() < kPattern.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kPattern.size(); ++i) {
    const char expected = kPattern[i];
    const unsigned char actual = static_cast<unsigned char>(base[i]);
    if (expected == 'd' ? !std::isdigit(actual) : actual != static_cast<unsigned char>(expected)) {
      return false;
    }
  }
  return true;
}
}  // namespace

void AtomicWriteFile(const fs::path& destination, const std::string& payload, const Observability* observability) {
  const fs::path parent = destination.has_parent_path() ? destination.parent_path() : fs::path(".");
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw LedgerException("디렉터리 생성 실패: " + parent.string() + " (" + ec.message() + ")",
                          error_code::kIoFailed);
  }

  const fs::path temp_path = destination.string() + "." + NewUuid() + ".tmp";
  bool renamed = false;
  try {
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
      throw LedgerException(ErrnoMessage("임시 파일 생성", temp_path, errno), error_code::kIoFailed);
    }
    try {
      WriteAll(fd, payload, temp_path);
    } catch (const LedgerException&) {
      ::close(fd);
      throw;
    }
    const int sync_rc = ::fsync(fd);
    const int sync_err = errno;
    ::close(fd);
    if (sync_rc != 0) {
      throw LedgerException(ErrnoMessage("fsync", temp_path, sync_err), error_code::kIoFailed);
    }

    if (::rename(temp_path.c_str(), destination.c_str()) != 0) {
      throw LedgerException(ErrnoMessage("rename", destination, errno), error_code::kIoFailed);
    }
    renamed = true;
    FsyncFile(destination);
  } catch (const LedgerException&) {
    if (!renamed) {
      fs::remove(temp_path, ec);
    }
    throw;
  }

  if (!FsyncDirectory(parent) && observability) {
    observability->Warn("dir_fsync_failed", "디렉터리 fsync에 실패했습니다", {{"path", parent.string()}});
  }
}

std::string ReadWholeFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw LedgerException("파일을 열 수 없습니다: " + path.string(), error_code::kIoFailed);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw LedgerException("파일 읽기 실패: " + path.string(), error_code::kIoFailed);
  }
  return buffer.str();
}

std::optional<std::int64_t> ParseBackupTimestamp(const std::string& file_name) {
  const auto ext = file_name.find(".json");
  const std::string base = file_name.substr(0, ext);
  if (base.empty()) {
    return std::nullopt;
  }

  if (MatchesIsoStamp(base)) {
    // 2024-01-01T00-00-00-000Z → 2024-01-01T00:00:00.000Z
    std::string iso = base.substr(0, 24);
    iso[13] = ':';
    iso[16] = ':';
    iso[19] = '.';
    return ParseIsoTimestamp(iso);
  }

  const auto dash = base.find('-');
  if (dash == std::string::npos) {
    return std::nullopt;
  }
  const std::string head = base.substr(0, dash);
  if (!AllDigits(head) || head.size() > 18) {
    return std::nullopt;
  }
  return std::stoll(head);
}

bool BackupThrottler::ShouldSkip(const std::string& prefix, std::int64_t now_ms, std::int64_t min_interval_ms,
                                 bool force) const {
  if (force) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = last_backup_ms_.find(prefix);
  if (it == last_backup_ms_.end() || it->second <= 0) {
    return false;
  }
  return now_ms - it->second < std::max<std::int64_t>(0, min_interval_ms);
}

void BackupThrottler::Record(const std::string& prefix, std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_backup_ms_[prefix] = now_ms;
}

void BackupThrottler::SeedIfAbsent(const std::string& prefix, std::int64_t newest_on_disk_ms) {
  if (newest_on_disk_ms <= 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  last_backup_ms_.emplace(prefix, newest_on_disk_ms);
}

std::optional<std::int64_t> BackupThrottler::LastBackup(const std::string& prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = last_backup_ms_.find(prefix);
  if (it == last_backup_ms_.end()) {
    return std::nullopt;
  }
  return it->second;
}

BackupManager::BackupManager(fs::path data_dir, BackupThrottler& throttler, std::shared_ptr<const Clock> clock,
                             std::shared_ptr<Observability> observability)
    : data_dir_(std::move(data_dir)),
      throttler_(throttler),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

fs::path BackupManager::BackupDir(const std::string& prefix) const { return data_dir_ / kBackupRoot / prefix; }

std::vector<fs::path> BackupManager::ListBackups(const std::string& prefix) const {
  std::vector<std::pair<std::int64_t, fs::path>> found;
  std::error_code ec;
  const fs::path dir = BackupDir(prefix);
  if (!fs::is_directory(dir, ec)) {
    return {};
  }
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    found.emplace_back(ParseBackupTimestamp(name).value_or(0), entry.path());
  }
  std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) {
      return a.first > b.first;
    }
    return a.second.filename().string() > b.second.filename().string();
  });
  std::vector<fs::path> paths;
  paths.reserve(found.size());
  for (auto& item : found) {
    paths.push_back(std::move(item.second));
  }
  return paths;
}

std::optional<fs::path> BackupManager::CopyToBackup(const std::string& prefix, const fs::path& source,
                                                    std::int64_t now_ms) {
  const auto existing = ListBackups(prefix);
  if (!existing.empty()) {
    throttler_.SeedIfAbsent(prefix, ParseBackupTimestamp(existing.front().filename().string()).value_or(0));
  }
  const auto last = throttler_.LastBackup(prefix);
  if (last && *last >= now_ms) {
    now_ms = *last + 1;
  }
  const fs::path backup_path = BackupDir(prefix) / (std::to_string(now_ms) + "-" + NewUuid() + ".json");
  try {
    AtomicWriteFile(backup_path, ReadWholeFile(source), observability_.get());
  } catch (const LedgerException& e) {
    if (observability_) {
      observability_->Warn("backup_copy_failed", e.what(), {{"prefix", prefix}, {"source", source.string()}});
    }
    return std::nullopt;
  }
  throttler_.Record(prefix, now_ms);
  if (observability_) {
    observability_->IncrementBackupsWritten();
  }
  return backup_path;
}

void BackupManager::EnforceRetention(const std::string& prefix, std::size_t max_retained) const {
  if (max_retained == 0) {
    return;
  }
  const auto backups = ListBackups(prefix);
  for (std::size_t i = max_retained; i < backups.size(); ++i) {
    std::error_code ec;
    fs::remove(backups[i], ec);
    if (ec && observability_) {
      observability_->Warn("backup_prune_failed", ec.message(), {{"path", backups[i].string()}});
    }
  }
}

std::optional<fs::path> BackupManager::WriteWithBackup(const WriteOptions& options) {
  AtomicWriteFile(options.file_path, options.payload, observability_.get());

  std::error_code ec;
  fs::create_directories(BackupDir(options.prefix), ec);
  if (ec) {
    throw LedgerException("백업 디렉터리 생성 실패: " + ec.message(), error_code::kIoFailed);
  }

  const auto existing = ListBackups(options.prefix);
  if (!existing.empty()) {
    throttler_.SeedIfAbsent(options.prefix,
                            ParseBackupTimestamp(existing.front().filename().string()).value_or(0));
  }

  const std::int64_t now = clock_->NowMillis();
  if (throttler_.ShouldSkip(options.prefix, now, options.min_interval_ms, options.force_backup)) {
    if (observability_) {
      observability_->IncrementBackupsSkipped();
    }
    EnforceRetention(options.prefix, options.max_retained);
    return std::nullopt;
  }

  auto backup = CopyToBackup(options.prefix, options.file_path, now);
  if (backup) {
    EnforceRetention(options.prefix, options.max_retained);
  }
  return backup;
}

std::optional<fs::path> BackupManager::SnapshotNow(const std::string& prefix, const fs::path& source,
                                                   std::size_t max_retained) {
  std::error_code ec;
  if (!fs::exists(source, ec)) {
    return std::nullopt;
  }
  auto backup = CopyToBackup(prefix, source, clock_->NowMillis());
  if (!backup) {
    throw LedgerException("파괴적 변경 전 백업을 만들지 못했습니다: " + source.string(), error_code::kIoFailed);
  }
  EnforceRetention(prefix, max_retained);
  return backup;
}

std::optional<BackupContent> BackupManager::LoadLatestBackup(const std::string& prefix) const {
  for (const auto& backup : ListBackups(prefix)) {
    std::string content;
    try {
      content = ReadWholeFile(backup);
    } catch (const LedgerException& e) {
      if (observability_) {
        observability_->Warn("backup_unreadable", e.what(), {{"path", backup.string()}});
      }
      continue;
    }
    if (!nlohmann::json::accept(content)) {
      if (observability_) {
        observability_->Warn("backup_unreadable", "손상된 백업을 건너뜁니다", {{"path", backup.string()}});
      }
      continue;
    }
    return BackupContent{backup, std::move(content)};
  }
  return std::nullopt;
}

bool BackupManager::RestoreLatestBackup(const std::string& prefix, const fs::path& destination) {
  auto latest = LoadLatestBackup(prefix);
  if (!latest) {
    return false;
  }
  AtomicWriteFile(destination, latest->content, observability_.get());
  if (observability_) {
    observability_->IncrementRestores();
    observability_->Info("backup_restored", "백업에서 복원했습니다",
                         {{"path", latest->path.string()}, {"destination", destination.string()}});
  }
  return true;
}

}  // namespace voteledger
