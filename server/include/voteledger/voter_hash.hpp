/*
 * 설명: 투표자 별칭을 정규화하고 솔트와 함께 SHA-256 해시로 바꾼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/voter_hash_test.cpp
 */
#pragma once

#include <optional>
#include <string>

namespace voteledger {

// 공백 제거, 소문자화, @ 뒤 도메인 제거.
std::string NormalizeAlias(const std::string& alias);

std::string Sha256Hex(const std::string& payload);

// 정규화된 별칭이 비어 있으면 nullopt.
std::optional<std::string> HashAliasForVoting(const std::string& alias, const std::string& salt);

}  // namespace voteledger
