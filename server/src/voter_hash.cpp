/*
 * 설명: 투표자 별칭 정규화와 OpenSSL EVP 기반 SHA-256 해시를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/voter_hash_test.cpp
 */
#include "voteledger/voter_hash.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

#include "voteledger/ledger_error.hpp"

namespace voteledger {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string NormalizeAlias(const std::string& alias) {
  const auto begin = alias.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = alias.find_last_not_of(" \t\r\n");
  std::string normalized = alias.substr(begin, end - begin + 1);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const auto at = normalized.find('@');
  if (at != std::string::npos) {
    normalized.resize(at);
  }
  return normalized;
}

std::string Sha256Hex(const std::string& payload) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw LedgerException("SHA-256 계산에 실패했습니다", error_code::kIoFailed);
  }
  return BytesToHex(digest, digest_len);
}

std::optional<std::string> HashAliasForVoting(const std::string& alias, const std::string& salt) {
  const std::string normalized = NormalizeAlias(alias);
  if (normalized.empty()) {
    return std::nullopt;
  }
  return Sha256Hex(normalized + ":" + salt);
}

}  // namespace voteledger
