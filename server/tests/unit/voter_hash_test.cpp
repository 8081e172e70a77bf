#include <gtest/gtest.h>

#include "voteledger/voter_hash.hpp"

namespace {

TEST(VoterHashTest, NormalizesAliasCaseWhitespaceAndDomain) {
  EXPECT_EQ(voteledger::NormalizeAlias("  John.Doe@Example.com "), "john.doe");
  EXPECT_EQ(voteledger::NormalizeAlias("PLAYER1"), "player1");
  EXPECT_EQ(voteledger::NormalizeAlias("   "), "");
}

TEST(VoterHashTest, Sha256MatchesKnownDigest) {
  EXPECT_EQ(voteledger::Sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(voteledger::Sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(VoterHashTest, HashesNormalizedAliasWithSalt) {
  const std::string salt = "ces3-vote-salt-v1";
  auto hash = voteledger::HashAliasForVoting("John.Doe@Example.com", salt);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ(*hash, voteledger::Sha256Hex("john.doe:" + salt));
  EXPECT_EQ(voteledger::HashAliasForVoting(" john.doe ", salt), hash);
  EXPECT_NE(voteledger::HashAliasForVoting("john.doe", "other-salt"), hash);
  EXPECT_FALSE(voteledger::HashAliasForVoting("  ", salt).has_value());
}

}  // namespace
