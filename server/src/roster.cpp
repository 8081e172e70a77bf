/*
 * 설명: contests.json / logos.json을 읽어 콘테스트 해석과 활성 로고 목록을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/vote_store_it_test.cpp
 */
#include "voteledger/roster.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "voteledger/clock.hpp"
#include "voteledger/config.hpp"
#include "voteledger/ledger_error.hpp"

namespace voteledger {
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

std::string StringField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return "";
  }
  return Trim(it->get<std::string>());
}

// 파일이 없으면 nullopt. 읽기/파싱 실패는 예외로 올린다.
std::optional<json> ReadJsonFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw LedgerException("파일을 열 수 없습니다: " + path, error_code::kIoFailed);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    return json::parse(buffer.str());
  } catch (const json::parse_error& e) {
    throw LedgerException("JSON 파싱 실패: " + path + " (" + e.what() + ")", error_code::kLedgerCorrupted);
  }
}
}  // namespace

std::vector<std::string> RosterIds(const std::vector<LogoEntry>& logos) {
  std::vector<std::string> ids;
  ids.reserve(logos.size());
  for (const auto& logo : logos) {
    ids.push_back(logo.id);
  }
  return ids;
}

std::vector<LogoEntry> ParseLogosDocument(const json& document) {
  const json* list = nullptr;
  if (document.is_array()) {
    list = &document;
  } else if (document.is_object()) {
    auto it = document.find("logos");
    if (it != document.end() && it->is_array()) {
      list = &*it;
    }
  }
  std::vector<LogoEntry> logos;
  if (!list) {
    return logos;
  }
  for (const auto& item : *list) {
    if (!item.is_object()) {
      continue;
    }
    LogoEntry logo;
    logo.id = StringField(item, "id");
    logo.name = StringField(item, "name");
    if (logo.id.empty() || logo.name.empty()) {
      continue;
    }
    logo.contest_id = StringField(item, "contestId");
    if (logo.contest_id.empty()) {
      logo.contest_id = kDefaultContestId;
    }
    logo.codename = StringField(item, "codename");
    if (logo.codename.empty()) {
      logo.codename = logo.name;
    }
    auto image = item.find("image");
    if (image != item.end() && image->is_string()) {
      logo.image = image->get<std::string>();
    }
    std::string removed_at = StringField(item, "removedAt");
    if (!removed_at.empty() && ParseIsoTimestamp(removed_at)) {
      logo.removed_at = removed_at;
    }
    logos.push_back(std::move(logo));
  }
  return logos;
}

JsonContestRegistry::JsonContestRegistry(std::string contests_path, std::string default_contest_id,
                                         std::shared_ptr<Observability> observability)
    : contests_path_(std::move(contests_path)),
      default_contest_id_(std::move(default_contest_id)),
      observability_(std::move(observability)) {}

JsonContestRegistry::Registry JsonContestRegistry::Load() const {
  Registry registry;
  std::optional<json> document;
  try {
    document = ReadJsonFile(contests_path_);
  } catch (const LedgerException& e) {
    if (observability_) {
      observability_->Warn("contest_registry_unreadable", e.what(), {{"path", contests_path_}});
    }
  }

  if (document && document->is_object()) {
    auto contests = document->find("contests");
    if (contests != document->end() && contests->is_array()) {
      for (const auto& item : *contests) {
        if (!item.is_object()) {
          continue;
        }
        ContestRecord record;
        record.slug = StringField(item, "slug");
        record.id = StringField(item, "id");
        if (record.id.empty()) {
          record.id = record.slug;
        }
        if (record.id.empty()) {
          continue;
        }
        if (record.slug.empty()) {
          record.slug = record.id;
        }
        record.title = StringField(item, "title");
        record.status = StringField(item, "status");
        if (record.status.empty()) {
          record.status = "draft";
        }
        auto voting_open = item.find("votingOpen");
        record.voting_open = voting_open == item.end() || !voting_open->is_boolean() || voting_open->get<bool>();
        registry.contests.push_back(std::move(record));
      }
    }
    registry.active_contest_id = StringField(*document, "activeContestId");
  }

  if (registry.contests.empty() || registry.active_contest_id.empty()) {
    ContestRecord fallback;
    fallback.id = default_contest_id_;
    fallback.slug = default_contest_id_;
    fallback.title = default_contest_id_;
    fallback.status = "active";
    fallback.voting_open = true;
    registry.contests = {fallback};
    registry.active_contest_id = default_contest_id_;
  }
  return registry;
}

std::string JsonContestRegistry::ResolveContestId(const std::string& contest_id) const {
  const Registry registry = Load();
  const std::string wanted = Trim(contest_id);
  if (wanted.empty()) {
    return registry.active_contest_id;
  }
  for (const auto& contest : registry.contests) {
    if (contest.id == wanted || contest.slug == wanted) {
      return contest.id;
    }
  }
  throw LedgerException("콘테스트를 찾을 수 없습니다: " + wanted, error_code::kContestNotFound);
}

std::vector<ContestRecord> JsonContestRegistry::Contests() const { return Load().contests; }

JsonLogoCatalog::JsonLogoCatalog(std::string logos_path, std::shared_ptr<Observability> observability)
    : logos_path_(std::move(logos_path)), observability_(std::move(observability)) {}

std::vector<LogoEntry> JsonLogoCatalog::AllLogos() const {
  std::optional<json> document = ReadJsonFile(logos_path_);
  if (!document) {
    if (observability_) {
      observability_->Warn("logo_catalog_missing", "로고 파일이 없습니다", {{"path", logos_path_}});
    }
    return {};
  }
  return ParseLogosDocument(*document);
}

std::vector<LogoEntry> JsonLogoCatalog::ActiveLogos(const std::string& contest_id) const {
  std::vector<LogoEntry> active;
  for (auto& logo : AllLogos()) {
    if (logo.contest_id == contest_id && logo.IsActive()) {
      active.push_back(std::move(logo));
    }
  }
  return active;
}

}  // namespace voteledger
