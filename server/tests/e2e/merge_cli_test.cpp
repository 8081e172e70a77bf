#include <sstream>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "support/ledger_test_support.hpp"
#include "voteledger/offline_merger.hpp"

namespace {

class MergeCliTest : public ::testing::Test {
 protected:
  void SetUp() override {
    input = dir.Path() / "exports";
    output = dir.Path() / "out" / "votes.json";
    voteledger_test::SeedLogos(dir.Path(), {{"alpha"}, {"beta"}, {"gamma"}});
    voteledger_test::WriteText(input / "node-a.json", R"({
      "version": 2, "updatedAt": "2024-01-01T00:00:00.000Z",
      "contests": {"badge-arena": {"updatedAt": "2024-01-01T00:00:00.000Z", "state": {"entries": {}, "history": [
        {"winnerId": "alpha", "loserId": "beta", "timestamp": 1000, "voterHash": "h1"}]}}}
    })");
    voteledger_test::WriteText(input / "node-b.JSON", R"({
      "state": {"entries": {}, "history": [
        {"winnerId": "beta", "loserId": "alpha", "timestamp": 4000, "voterHash": "h2"},
        {"winnerId": "alpha", "loserId": "beta", "timestamp": 1000, "voterHash": "h1"}]},
      "updatedAt": "2024-01-02T00:00:00.000Z"
    })");
    voteledger_test::WriteText(input / "notes.txt", "ignored");
  }

  int Run(const std::vector<std::string>& args) { return voteledger::RunMergeCli(args, out, err); }

  voteledger_test::TempDataDir dir;
  std::filesystem::path input;
  std::filesystem::path output;
  std::ostringstream out;
  std::ostringstream err;
};

TEST_F(MergeCliTest, WritesMergedLedger) {
  ASSERT_EQ(Run({"--input", input.string(), "--output", output.string(), "--logos",
                 (dir.Path() / "logos.json").string()}),
            0)
      << err.str();

  auto merged = nlohmann::json::parse(voteledger_test::ReadText(output));
  EXPECT_EQ(merged["version"], 2);
  const auto& contest = merged["contests"]["badge-arena"];
  EXPECT_EQ(contest["updatedAt"], "2024-01-02T00:00:00.000Z");
  ASSERT_EQ(contest["state"]["history"].size(), 2u);
  EXPECT_EQ(contest["state"]["history"][0]["timestamp"], 4000);
  EXPECT_EQ(contest["state"]["entries"]["gamma"]["rating"], 1500.0);
  EXPECT_NEAR(contest["state"]["entries"]["alpha"]["rating"].get<double>(), 1498.53, 0.005);
  EXPECT_NE(out.str().find("매치 2건 적용, 중복 1건 제외"), std::string::npos);
}

TEST_F(MergeCliTest, DryRunLeavesOutputUntouched) {
  ASSERT_EQ(Run({"--input=" + input.string(), "--output=" + output.string(), "--dry-run", "--logos",
                 (dir.Path() / "logos.json").string()}),
            0);
  EXPECT_FALSE(std::filesystem::exists(output));
  EXPECT_NE(out.str().find("[dry-run]"), std::string::npos);
}

TEST_F(MergeCliTest, ContestFilterWithNoMatchesFails) {
  EXPECT_EQ(Run({"--input", input.string(), "--output", output.string(), "--contest", "spring"}), 1);
  EXPECT_NE(err.str().find("오류(validation_failed)"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(MergeCliTest, HelpAndArgumentErrors) {
  EXPECT_EQ(Run({"--help"}), 0);
  EXPECT_NE(out.str().find("사용법"), std::string::npos);

  EXPECT_EQ(Run({"--output", output.string()}), 1);
  EXPECT_NE(err.str().find("오류(invalid_argument)"), std::string::npos);

  voteledger_test::TempDataDir empty;
  EXPECT_EQ(Run({"--input", empty.Path().string(), "--output", output.string()}), 1);
}

}  // namespace
