/*
 * 설명: 콘테스트 레지스트리와 로고 카탈로그(외부 협력자)의 조회 인터페이스와 JSON 파일 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/vote_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voteledger/observability.hpp"

namespace voteledger {

struct LogoEntry {
  std::string id;
  std::string contest_id;
  std::string name;
  std::string codename;
  std::string image;
  std::optional<std::string> removed_at;

  bool IsActive() const { return !removed_at.has_value(); }
};

struct ContestRecord {
  std::string id;
  std::string slug;
  std::string title;
  std::string status;
  bool voting_open{false};
};

class ContestRegistry {
 public:
  virtual ~ContestRegistry() = default;
  // 빈 식별자는 현재 활성 콘테스트로 해석한다. 없는 콘테스트면 contest_not_found 예외.
  virtual std::string ResolveContestId(const std::string& contest_id) const = 0;
};

class LogoCatalog {
 public:
  virtual ~LogoCatalog() = default;
  virtual std::vector<LogoEntry> ActiveLogos(const std::string& contest_id) const = 0;
};

std::vector<std::string> RosterIds(const std::vector<LogoEntry>& logos);

// 형식이 맞지 않는 항목은 건너뛴다.
std::vector<LogoEntry> ParseLogosDocument(const nlohmann::json& document);

class JsonContestRegistry : public ContestRegistry {
 public:
  JsonContestRegistry(std::string contests_path, std::string default_contest_id,
                      std::shared_ptr<Observability> observability);

  std::string ResolveContestId(const std::string& contest_id) const override;
  std::vector<ContestRecord> Contests() const;

 private:
  struct Registry {
    std::string active_contest_id;
    std::vector<ContestRecord> contests;
  };

  Registry Load() const;

  std::string contests_path_;
  std::string default_contest_id_;
  std::shared_ptr<Observability> observability_;
};

class JsonLogoCatalog : public LogoCatalog {
 public:
  JsonLogoCatalog(std::string logos_path, std::shared_ptr<Observability> observability);

  std::vector<LogoEntry> ActiveLogos(const std::string& contest_id) const override;
  std::vector<LogoEntry> AllLogos() const;

 private:
  std::string logos_path_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace voteledger
