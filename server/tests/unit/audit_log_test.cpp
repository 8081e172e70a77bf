#include <algorithm>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "support/ledger_test_support.hpp"
#include "voteledger/audit_log.hpp"

namespace {

class AuditLogTest : public ::testing::Test {
 protected:
  AuditLogTest()
      : clock(std::make_shared<voteledger_test::ManualClock>()),
        observability(std::make_shared<voteledger::Observability>(voteledger::LogLevel::kDebug)),
        log(dir.Path() / voteledger::kVoteEventsFileName, clock, observability) {
    observability->SetSink(&log_output);
  }

  voteledger::VoteRecordedEvent Vote(const std::string& contest, const std::string& occurred_at = "") const {
    voteledger::VoteRecordedEvent event;
    event.occurred_at = occurred_at;
    event.contest_id = contest;
    event.voter_hash = "hash-1";
    event.match_timestamp = voteledger_test::kBaseTime;
    event.match_history_length = 1;
    event.winner = {"alpha", "Alpha", "alpha-code", 1500, 1516, 0, 1, 0, 0, 0, 1};
    event.loser = {"beta", "Beta", "beta-code", 1500, 1484, 0, 0, 0, 1, 0, 1};
    return event;
  }

  voteledger_test::TempDataDir dir;
  std::shared_ptr<voteledger_test::ManualClock> clock;
  std::ostringstream log_output;
  std::shared_ptr<voteledger::Observability> observability;
  voteledger::AuditLog log;
};

TEST_F(AuditLogTest, AppendFillsIdentityAndWritesOneLine) {
  auto stored = log.Append(Vote("badge-arena"));
  const auto& vote = std::get<voteledger::VoteRecordedEvent>(stored);
  EXPECT_FALSE(vote.id.empty());
  EXPECT_EQ(vote.occurred_at, "2024-01-01T00:00:00.000Z");

  const std::string text = voteledger_test::ReadText(log.Path());
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.back(), '\n');
  EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 1);

  auto line = nlohmann::json::parse(text);
  EXPECT_EQ(line["type"], "vote-recorded");
  EXPECT_EQ(line["contestId"], "badge-arena");
  EXPECT_EQ(line["winner"]["ratingAfter"], 1516.0);

  auto read = log.ReadAll();
  ASSERT_EQ(read.events.size(), 1u);
  EXPECT_TRUE(read.rejected.empty());
  EXPECT_EQ(std::get<voteledger::VoteRecordedEvent>(read.events[0]).loser.id, "beta");
  EXPECT_EQ(observability->Snapshot().audit_events, 1u);
}

TEST_F(AuditLogTest, ResetWithoutInitiatorSerializesNull) {
  voteledger::VotesResetEvent reset;
  reset.contest_id = "badge-arena";
  reset.reason = "manual-reset";
  reset.previous_match_count = 3;
  log.Append(reset);

  auto line = nlohmann::json::parse(voteledger_test::ReadText(log.Path()));
  EXPECT_EQ(line["type"], "votes-reset");
  EXPECT_TRUE(line["initiator"].is_null());
  EXPECT_EQ(line["previousMatchCount"], 3);
}

TEST_F(AuditLogTest, ReadContestFiltersAndOrdersByOccurrence) {
  log.Append(Vote("badge-arena", "2024-01-01T00:00:05.000Z"));
  log.Append(Vote("spring", "2024-01-01T00:00:01.000Z"));
  log.Append(Vote("badge-arena", "2024-01-01T00:00:02.000Z"));
  voteledger::EntriesPrunedEvent pruned;
  pruned.contest_id = "badge-arena";
  pruned.occurred_at = "2024-01-01T00:00:02.000Z";
  pruned.removed_ids = {"gamma"};
  log.Append(pruned);

  auto read = log.ReadContest("badge-arena");
  ASSERT_EQ(read.events.size(), 3u);
  EXPECT_EQ(voteledger::EventOccurredAt(read.events[0]), "2024-01-01T00:00:02.000Z");
  EXPECT_TRUE(std::holds_alternative<voteledger::VoteRecordedEvent>(read.events[0]));
  EXPECT_TRUE(std::holds_alternative<voteledger::EntriesPrunedEvent>(read.events[1]));
  EXPECT_EQ(voteledger::EventOccurredAt(read.events[2]), "2024-01-01T00:00:05.000Z");
}

TEST_F(AuditLogTest, MalformedLinesAreRejectedWithLineNumbers) {
  log.Append(Vote("badge-arena"));
  std::string text = voteledger_test::ReadText(log.Path());
  text += "not json\n\n{\"type\":\"vote-teleported\",\"id\":\"x\"}\n";
  voteledger_test::WriteText(log.Path(), text);

  auto read = log.ReadAll();
  EXPECT_EQ(read.events.size(), 1u);
  ASSERT_EQ(read.rejected.size(), 2u);
  EXPECT_EQ(read.rejected[0].location, "vote-events.ndjson:2");
  EXPECT_EQ(read.rejected[1].location, "vote-events.ndjson:4");
}

TEST_F(AuditLogTest, NegativeCountersAreRejected) {
  auto line = voteledger::AuditEventToJson(log.Append(Vote("badge-arena")));
  line["id"] = "negative-wins";
  line["winner"]["winsBefore"] = -1;
  auto history = line;
  history["id"] = "negative-history";
  history["winner"]["winsBefore"] = 0;
  history["matchHistoryLength"] = -3;
  std::string text = voteledger_test::ReadText(log.Path());
  text += line.dump() + "\n" + history.dump() + "\n";
  voteledger_test::WriteText(log.Path(), text);

  auto read = log.ReadAll();
  ASSERT_EQ(read.events.size(), 1u);
  EXPECT_NE(std::get<voteledger::VoteRecordedEvent>(read.events[0]).id, "negative-wins");
  ASSERT_EQ(read.rejected.size(), 2u);
  EXPECT_EQ(read.rejected[0].location, "vote-events.ndjson:2");
  EXPECT_EQ(read.rejected[1].location, "vote-events.ndjson:3");
}

TEST_F(AuditLogTest, MissingLogReadsEmpty) {
  auto read = log.ReadAll();
  EXPECT_TRUE(read.events.empty());
  EXPECT_TRUE(read.rejected.empty());
}

}  // namespace
