/*
 * 설명: Elo 레이팅 갱신, 로스터 정렬, 대결 쌍 선택을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_engine_test.cpp
 */
#include "voteledger/rating.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace voteledger {
namespace {
std::pair<std::string, std::string> PairKey(const std::string& a, const std::string& b) {
  return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

struct Candidate {
  std::string id;
  RatingEntry entry;
};
}  // namespace

bool operator==(const RatingEntry& lhs, const RatingEntry& rhs) {
  return lhs.rating == rhs.rating && lhs.wins == rhs.wins && lhs.losses == rhs.losses && lhs.matches == rhs.matches;
}

bool operator!=(const RatingEntry& lhs, const RatingEntry& rhs) { return !(lhs == rhs); }

bool operator==(const MatchRecord& lhs, const MatchRecord& rhs) {
  return lhs.winner_id == rhs.winner_id && lhs.loser_id == rhs.loser_id && lhs.timestamp == rhs.timestamp &&
         lhs.voter_hash == rhs.voter_hash;
}

bool MatchOrderLess(const MatchRecord& lhs, const MatchRecord& rhs) {
  if (lhs.timestamp != rhs.timestamp) {
    return lhs.timestamp < rhs.timestamp;
  }
  if (lhs.winner_id != rhs.winner_id) {
    return lhs.winner_id < rhs.winner_id;
  }
  if (lhs.loser_id != rhs.loser_id) {
    return lhs.loser_id < rhs.loser_id;
  }
  return lhs.voter_hash.value_or("") < rhs.voter_hash.value_or("");
}

bool operator==(const RatingState& lhs, const RatingState& rhs) {
  return lhs.entries == rhs.entries && lhs.history == rhs.history;
}

std::optional<std::string> NormalizeVoterHash(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  const auto begin = value->find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  const auto end = value->find_last_not_of(" \t\r\n");
  return value->substr(begin, end - begin + 1);
}

RatingEngine::RatingEngine(std::size_t history_limit) : history_limit_(history_limit) {}

double RatingEngine::ExpectedScore(double rating_a, double rating_b) const {
  return 1.0 / (1.0 + std::pow(10.0, (rating_b - rating_a) / 400.0));
}

RatingState RatingEngine::ApplyMatch(RatingState state, const std::string& winner_id, const std::string& loser_id,
                                     const std::optional<std::string>& voter_hash, std::int64_t timestamp) const {
  const RatingEntry winner = state.entries.count(winner_id) ? state.entries[winner_id] : RatingEntry{};
  const RatingEntry loser = state.entries.count(loser_id) ? state.entries[loser_id] : RatingEntry{};

  const double expected_winner = ExpectedScore(winner.rating, loser.rating);
  const double expected_loser = ExpectedScore(loser.rating, winner.rating);

  RatingEntry next_winner = winner;
  next_winner.rating = winner.rating + k_factor_ * (1.0 - expected_winner);
  next_winner.wins += 1;
  next_winner.matches += 1;

  RatingEntry next_loser = loser;
  next_loser.rating = loser.rating + k_factor_ * (0.0 - expected_loser);
  next_loser.losses += 1;
  next_loser.matches += 1;

  state.entries[winner_id] = next_winner;
  state.entries[loser_id] = next_loser;

  state.history.push_front(MatchRecord{winner_id, loser_id, timestamp, NormalizeVoterHash(voter_hash)});
  if (history_limit_ > 0 && state.history.size() > history_limit_) {
    state.history.resize(history_limit_);
  }
  return state;
}

std::optional<RatingState> RatingEngine::EnsureEntries(const RatingState& state,
                                                       const std::vector<std::string>& roster) const {
  std::optional<RatingState> next;
  for (const auto& id : roster) {
    if (state.entries.count(id) || (next && next->entries.count(id))) {
      continue;
    }
    if (!next) {
      next = state;
    }
    next->entries.emplace(id, RatingEntry{});
  }
  return next;
}

std::optional<RatingState> RatingEngine::PruneEntries(const RatingState& state,
                                                      const std::vector<std::string>& roster) const {
  const std::set<std::string> active(roster.begin(), roster.end());
  bool mutated = false;

  RatingState next;
  for (const auto& [id, entry] : state.entries) {
    if (active.count(id)) {
      next.entries.emplace(id, entry);
    } else {
      mutated = true;
    }
  }
  for (const auto& match : state.history) {
    if (active.count(match.winner_id) && active.count(match.loser_id)) {
      next.history.push_back(match);
    } else {
      mutated = true;
    }
  }

  if (!mutated) {
    return std::nullopt;
  }
  return next;
}

RatingState RatingEngine::BlankState(const std::vector<std::string>& roster) const {
  RatingState state;
  for (const auto& id : roster) {
    state.entries.emplace(id, RatingEntry{});
  }
  return state;
}

std::optional<Matchup> RatingEngine::ProduceMatchup(const std::vector<std::string>& roster,
                                                    const std::map<std::string, RatingEntry>& entries,
                                                    const std::optional<Matchup>& previous) const {
  if (roster.size() < 2) {
    return std::nullopt;
  }

  std::optional<std::pair<std::string, std::string>> avoided;
  if (previous) {
    avoided = PairKey(previous->primary_id, previous->challenger_id);
  }

  std::vector<Candidate> catalog;
  catalog.reserve(roster.size());
  for (const auto& id : roster) {
    auto it = entries.find(id);
    catalog.push_back(Candidate{id, it != entries.end() ? it->second : RatingEntry{}});
  }

  std::vector<Candidate> primaries = catalog;
  std::stable_sort(primaries.begin(), primaries.end(), [](const Candidate& a, const Candidate& b) {
    if (a.entry.matches == b.entry.matches) {
      return a.entry.rating < b.entry.rating;
    }
    return a.entry.matches < b.entry.matches;
  });

  std::optional<Matchup> fallback;
  for (const auto& primary : primaries) {
    std::vector<Candidate> challengers;
    for (const auto& candidate : catalog) {
      if (candidate.id != primary.id) {
        challengers.push_back(candidate);
      }
    }
    const double base = primary.entry.rating;
    std::stable_sort(challengers.begin(), challengers.end(), [base](const Candidate& a, const Candidate& b) {
      const double diff_a = std::fabs(a.entry.rating - base);
      const double diff_b = std::fabs(b.entry.rating - base);
      if (diff_a == diff_b) {
        return a.entry.matches < b.entry.matches;
      }
      return diff_a < diff_b;
    });

    if (!challengers.empty() && !fallback) {
      fallback = Matchup{primary.id, challengers.front().id};
    }
    for (const auto& challenger : challengers) {
      if (avoided && PairKey(primary.id, challenger.id) == *avoided) {
        continue;
      }
      return Matchup{primary.id, challenger.id};
    }
  }
  return fallback;
}

}  // namespace voteledger
